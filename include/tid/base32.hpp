#pragma once

#include <tid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tid {

using UuidBytes = std::array<uint8_t, 16>;

namespace base32 {

// Crockford-style alphabet: digits and lowercase letters without i, l, o, u.
inline constexpr char ALPHABET[] = "0123456789abcdefghjkmnpqrstvwxyz";
inline constexpr size_t ENCODED_LEN = 26;

// Largest symbol value allowed in the first position. The 26 symbols
// hold 130 bits, so the top two must stay zero for a 128-bit value.
inline constexpr int MAX_FIRST_VALUE = 7;

// Symbol value 0..31 for an alphabet character, -1 otherwise.
int value_of(char c);

// 16 bytes, big-endian, as 26 symbols. Total.
std::string encode(const UuidBytes& bytes);

// Inverse of encode. Fails on wrong length or a character outside the
// alphabet; a first symbol above MAX_FIRST_VALUE is not rejected here.
Result<UuidBytes> decode(const std::string& s);

} // namespace base32
} // namespace tid
