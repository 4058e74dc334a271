#include <tid/error.hpp>

namespace tid {

TidError TidError::invalid_prefix(const std::string& prefix) {
    TidError e(InvalidPrefix, "invalid prefix '" + prefix + "'",
               "must be at most 63 lowercase ascii letters [a-z]");
    e.detail = InvalidPrefixError{prefix};
    return e;
}

TidError TidError::invalid_suffix_length(size_t length) {
    TidError e(InvalidSuffixLength,
               "invalid length. suffix should have 26 characters, got " +
               std::to_string(length));
    e.detail = InvalidSuffixLengthError{length};
    return e;
}

TidError TidError::invalid_suffix_character(char c) {
    TidError e(InvalidSuffixCharacter,
               std::string("invalid suffix. found invalid character: ") + c,
               "allowed: 0123456789abcdefghjkmnpqrstvwxyz, first character 0-7");
    e.detail = InvalidSuffixCharacterError{c};
    return e;
}

TidError TidError::prefix_mismatch(const std::string& expected,
                                   const std::string& actual) {
    TidError e(PrefixMismatch,
               "invalid typeid. prefix mismatch. expected " + expected +
               ", got " + actual);
    e.detail = PrefixMismatchError{expected, actual};
    return e;
}

TidError TidError::malformed_uuid(const std::string& text, std::string hint) {
    TidError e(MalformedUuid, "malformed uuid '" + text + "'", std::move(hint));
    e.detail = MalformedUuidError{text};
    return e;
}

const char* TidError::code_name(Code c) {
    switch (c) {
        case InvalidPrefix:          return "InvalidPrefix";
        case InvalidSuffixLength:    return "InvalidSuffixLength";
        case InvalidSuffixCharacter: return "InvalidSuffixCharacter";
        case PrefixMismatch:         return "PrefixMismatch";
        case MalformedUuid:          return "MalformedUuid";
        case IO:                     return "IO";
        case Config:                 return "Config";
        case InvalidArg:             return "InvalidArg";
    }
    return "Unknown";
}

std::string TidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

bool operator==(const TidError& a, const TidError& b) {
    return a.code == b.code && a.detail == b.detail;
}

bool operator!=(const TidError& a, const TidError& b) {
    return !(a == b);
}

} // namespace tid
