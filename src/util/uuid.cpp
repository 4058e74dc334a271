#include <tid/uuid.hpp>
#include <chrono>
#include <fstream>
#include <random>

namespace tid {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

static void set_version_and_variant(Uuid& u, uint8_t version) {
    u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0F) | (version << 4));
    // Variant 1: bytes[8] top two bits = 10
    u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3F) | 0x80);
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

// ---- Construction ----

Uuid Uuid::nil() {
    return Uuid{};
}

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);
    set_version_and_variant(u, 4);
    return u;
}

Uuid Uuid::v7() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);

    auto now = std::chrono::system_clock::now().time_since_epoch();
    uint64_t ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    for (int i = 0; i < 6; ++i) {
        u.bytes[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));
    }
    set_version_and_variant(u, 7);
    return u;
}

int Uuid::version() const {
    return bytes[6] >> 4;
}

// ---- to_string: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

// ---- from_string ----

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return TidError::malformed_uuid(s,
            "expected 36 characters in the form xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, got " +
            std::to_string(s.size()));
    }

    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < 36; ) {
        if (is_dash_position(i)) {
            if (s[i] != '-') {
                return TidError::malformed_uuid(s,
                    "expected '-' at position " + std::to_string(i));
            }
            ++i;
            continue;
        }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return TidError::malformed_uuid(s,
                "invalid hex character at position " + std::to_string(bad));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

// ---- Comparison ----

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

} // namespace tid
