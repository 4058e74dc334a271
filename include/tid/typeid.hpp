#pragma once

#include <tid/result.hpp>
#include <tid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tid {

enum class UuidVersion { V4, V7 };

// Result of splitting at the last '_'. Without a separator the whole
// text is the suffix and the prefix is empty. A valid prefix has no '_',
// so for well-formed text this is also the first one.
struct TypeIdParts {
    std::string prefix;
    std::string suffix;
    bool has_separator = false;
};

TypeIdParts split_typeid(const std::string& text);

// A type prefix plus a 26-character base32 UUID suffix.
// Instances only come out of the factories below, so every TypeId holds
// a valid prefix and a canonical suffix.
class TypeId {
public:
    // Validates prefix, then either validates `suffix` or encodes a
    // freshly generated UUID of the requested version.
    static Result<TypeId> create(const std::string& prefix,
                                 const std::optional<std::string>& suffix = std::nullopt,
                                 UuidVersion version = UuidVersion::V7);

    // Parses "prefix_suffix" or a bare suffix. Checks the suffix, then the
    // prefix, then the expectation. When `expected_prefix` is
    // given, the parsed prefix must equal it; an empty expectation means
    // "no prefix" and is reported as "NONE" on mismatch.
    static Result<TypeId> parse(const std::string& text,
                                const std::optional<std::string>& expected_prefix = std::nullopt);

    static Result<TypeId> from_uuid_bytes(const std::string& prefix, const UuidBytes& bytes);
    static Result<TypeId> from_uuid(const std::string& uuid_text, const std::string& prefix = "");

    const std::string& prefix() const { return prefix_; }
    const std::string& suffix() const { return suffix_; }

    // "prefix_suffix", or the bare suffix when the prefix is empty
    std::string to_string() const;

    Uuid uuid() const;
    std::string to_uuid() const;

    bool operator==(const TypeId& o) const;
    bool operator!=(const TypeId& o) const;
    // Orders by prefix, then suffix. Suffixes sort like their UUID bytes.
    bool operator<(const TypeId& o) const;

private:
    TypeId(std::string prefix, std::string suffix)
        : prefix_(std::move(prefix)), suffix_(std::move(suffix)) {}

    std::string prefix_;
    std::string suffix_;
};

} // namespace tid

namespace std {
template<>
struct hash<tid::TypeId> {
    size_t operator()(const tid::TypeId& id) const {
        size_t h = hash<string>{}(id.prefix());
        return h ^ (hash<string>{}(id.suffix()) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};
} // namespace std
