#pragma once

#include <tid/base32.hpp>
#include <tid/result.hpp>
#include <cstdint>
#include <string>

namespace tid {

struct Uuid {
    UuidBytes bytes{};

    static Uuid nil();
    static Uuid v4();
    // Time-ordered: 48-bit unix milliseconds, then random bits.
    static Uuid v7();

    // Canonical text: lowercase hex, 8-4-4-4-12
    std::string to_string() const;
    // Accepts hex digits of either case; anything else is MalformedUuid.
    static Result<Uuid> from_string(const std::string& s);

    int version() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

} // namespace tid
