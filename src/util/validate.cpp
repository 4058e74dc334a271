#include <tid/validate.hpp>
#include <tid/base32.hpp>

namespace tid {

static bool is_lower_ascii(char c) {
    return c >= 'a' && c <= 'z';
}

Status validate_prefix(const std::string& prefix) {
    if (prefix.size() > MAX_PREFIX_LEN) {
        return TidError::invalid_prefix(prefix);
    }
    for (char c : prefix) {
        if (!is_lower_ascii(c)) {
            return TidError::invalid_prefix(prefix);
        }
    }
    return ok_status();
}

Status validate_suffix(const std::string& suffix) {
    if (suffix.size() != base32::ENCODED_LEN) {
        return TidError::invalid_suffix_length(suffix.size());
    }
    for (char c : suffix) {
        if (base32::value_of(c) < 0) {
            return TidError::invalid_suffix_character(c);
        }
    }
    if (base32::value_of(suffix[0]) > base32::MAX_FIRST_VALUE) {
        return TidError::invalid_suffix_character(suffix[0]);
    }
    return ok_status();
}

} // namespace tid
