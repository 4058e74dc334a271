#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace tid {

// Payloads, one per rejection reason. Each carries only the offending value.
struct InvalidPrefixError {
    std::string prefix;
};

struct InvalidSuffixLengthError {
    size_t length = 0;
};

struct InvalidSuffixCharacterError {
    char character = '\0';
};

struct PrefixMismatchError {
    std::string expected;  // "NONE" when no prefix was expected
    std::string actual;
};

struct MalformedUuidError {
    std::string text;
};

inline bool operator==(const InvalidPrefixError& a, const InvalidPrefixError& b) {
    return a.prefix == b.prefix;
}
inline bool operator==(const InvalidSuffixLengthError& a, const InvalidSuffixLengthError& b) {
    return a.length == b.length;
}
inline bool operator==(const InvalidSuffixCharacterError& a, const InvalidSuffixCharacterError& b) {
    return a.character == b.character;
}
inline bool operator==(const PrefixMismatchError& a, const PrefixMismatchError& b) {
    return a.expected == b.expected && a.actual == b.actual;
}
inline bool operator==(const MalformedUuidError& a, const MalformedUuidError& b) {
    return a.text == b.text;
}

struct TidError {
    enum Code {
        InvalidPrefix,
        InvalidSuffixLength,
        InvalidSuffixCharacter,
        PrefixMismatch,
        MalformedUuid,
        IO,
        Config,
        InvalidArg
    };

    using Detail = std::variant<std::monostate,
                                InvalidPrefixError,
                                InvalidSuffixLengthError,
                                InvalidSuffixCharacterError,
                                PrefixMismatchError,
                                MalformedUuidError>;

    Code code = IO;
    Detail detail;
    std::string message;
    std::string hint;

    TidError() = default;
    TidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    static TidError invalid_prefix(const std::string& prefix);
    static TidError invalid_suffix_length(size_t length);
    static TidError invalid_suffix_character(char c);
    static TidError prefix_mismatch(const std::string& expected,
                                    const std::string& actual);
    static TidError malformed_uuid(const std::string& text, std::string hint);

    // Typed view of the payload; nullptr when the error is of another kind.
    template<typename T>
    const T* as() const { return std::get_if<T>(&detail); }

    std::string format() const;
    static const char* code_name(Code c);
};

// Equal when code and payload agree; message and hint are presentation only.
bool operator==(const TidError& a, const TidError& b);
bool operator!=(const TidError& a, const TidError& b);

} // namespace tid
