#include <tid/base32.hpp>

namespace tid::base32 {

static constexpr std::array<int8_t, 256> DECODE_TABLE = [] {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}();

int value_of(char c) {
    return DECODE_TABLE[static_cast<unsigned char>(c)];
}

// ---- encode ----
// The 128-bit value is left-padded with two zero bits to 130 bits and
// emitted as 26 groups of 5 bits, most significant group first.

std::string encode(const UuidBytes& bytes) {
    std::string out;
    out.reserve(ENCODED_LEN);

    uint32_t buffer = 0;
    int bits = 2;  // padding
    for (uint8_t b : bytes) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out += ALPHABET[(buffer >> bits) & 0x1F];
        }
        buffer &= (1u << bits) - 1;
    }
    return out;
}

// ---- decode ----

Result<UuidBytes> decode(const std::string& s) {
    if (s.size() != ENCODED_LEN) {
        return TidError::invalid_suffix_length(s.size());
    }

    UuidBytes out{};
    size_t byte_idx = 0;
    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < ENCODED_LEN; ++i) {
        int v = value_of(s[i]);
        if (v < 0) {
            return TidError::invalid_suffix_character(s[i]);
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (i == 0) {
            // Drop the two padding bits
            buffer &= 0x07;
            bits = 3;
        }
        while (bits >= 8) {
            bits -= 8;
            out[byte_idx++] = static_cast<uint8_t>((buffer >> bits) & 0xFF);
        }
        buffer &= (1u << bits) - 1;
    }
    return Result<UuidBytes>::ok(out);
}

} // namespace tid::base32
