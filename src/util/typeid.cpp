#include <tid/typeid.hpp>
#include <tid/base32.hpp>
#include <tid/validate.hpp>

namespace tid {

TypeIdParts split_typeid(const std::string& text) {
    TypeIdParts parts;
    auto pos = text.rfind('_');
    if (pos == std::string::npos) {
        parts.suffix = text;
        return parts;
    }
    parts.prefix = text.substr(0, pos);
    parts.suffix = text.substr(pos + 1);
    parts.has_separator = true;
    return parts;
}

Result<TypeId> TypeId::create(const std::string& prefix,
                              const std::optional<std::string>& suffix,
                              UuidVersion version) {
    TID_TRY(validate_prefix(prefix));

    if (suffix.has_value()) {
        TID_TRY(validate_suffix(*suffix));
        return Result<TypeId>::ok(TypeId(prefix, *suffix));
    }

    Uuid u = version == UuidVersion::V4 ? Uuid::v4() : Uuid::v7();
    return Result<TypeId>::ok(TypeId(prefix, base32::encode(u.bytes)));
}

Result<TypeId> TypeId::parse(const std::string& text,
                             const std::optional<std::string>& expected_prefix) {
    auto parts = split_typeid(text);

    TID_TRY(validate_suffix(parts.suffix));
    // "_suffix" would render back without the separator
    if (parts.has_separator && parts.prefix.empty()) {
        return TidError::invalid_prefix(parts.prefix);
    }
    TID_TRY(validate_prefix(parts.prefix));

    if (expected_prefix.has_value() && *expected_prefix != parts.prefix) {
        std::string expected = expected_prefix->empty() ? "NONE" : *expected_prefix;
        return TidError::prefix_mismatch(expected, parts.prefix);
    }

    return Result<TypeId>::ok(TypeId(std::move(parts.prefix), std::move(parts.suffix)));
}

Result<TypeId> TypeId::from_uuid_bytes(const std::string& prefix, const UuidBytes& bytes) {
    TID_TRY(validate_prefix(prefix));
    return Result<TypeId>::ok(TypeId(prefix, base32::encode(bytes)));
}

Result<TypeId> TypeId::from_uuid(const std::string& uuid_text, const std::string& prefix) {
    auto u = Uuid::from_string(uuid_text);
    if (u.is_err()) return std::move(u).error();
    return from_uuid_bytes(prefix, u.value().bytes);
}

std::string TypeId::to_string() const {
    if (prefix_.empty()) return suffix_;
    return prefix_ + "_" + suffix_;
}

Uuid TypeId::uuid() const {
    // suffix_ was validated on construction; decoding cannot fail
    Uuid u;
    u.bytes = base32::decode(suffix_).value();
    return u;
}

std::string TypeId::to_uuid() const {
    return uuid().to_string();
}

bool TypeId::operator==(const TypeId& o) const {
    return prefix_ == o.prefix_ && suffix_ == o.suffix_;
}

bool TypeId::operator!=(const TypeId& o) const {
    return !(*this == o);
}

bool TypeId::operator<(const TypeId& o) const {
    if (prefix_ != o.prefix_) return prefix_ < o.prefix_;
    return suffix_ < o.suffix_;
}

} // namespace tid
