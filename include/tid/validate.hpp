#pragma once

#include <tid/result.hpp>
#include <cstddef>
#include <string>

namespace tid {

inline constexpr size_t MAX_PREFIX_LEN = 63;

// Empty, or 1..63 characters of [a-z].
Status validate_prefix(const std::string& prefix);

// Checked in order, first failure wins:
//   length == 26                 -> InvalidSuffixLength
//   every character in alphabet  -> InvalidSuffixCharacter (first offender)
//   first symbol value <= 7      -> InvalidSuffixCharacter (s[0])
Status validate_suffix(const std::string& suffix);

} // namespace tid
