#include <catch2/catch.hpp>
#include <tid/validate.hpp>
#include <string>

using namespace tid;

// ===== Prefix =====

TEST_CASE("empty prefix is valid", "[validate]") {
    REQUIRE(validate_prefix("").is_ok());
}

TEST_CASE("lowercase prefixes are valid", "[validate]") {
    REQUIRE(validate_prefix("user").is_ok());
    REQUIRE(validate_prefix("a").is_ok());
    REQUIRE(validate_prefix(std::string(63, 'z')).is_ok());
}

TEST_CASE("uppercase prefix is rejected with its value", "[validate]") {
    auto r = validate_prefix("TEST");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::InvalidPrefix);
    REQUIRE(r.error().as<InvalidPrefixError>()->prefix == "TEST");
}

TEST_CASE("whitespace-only prefix is rejected", "[validate]") {
    auto r = validate_prefix("  ");
    REQUIRE(r.is_err());
    REQUIRE(r.error() == TidError::invalid_prefix("  "));
}

TEST_CASE("prefix with digits, underscore or punctuation is rejected", "[validate]") {
    REQUIRE(validate_prefix("user1").is_err());
    REQUIRE(validate_prefix("my_type").is_err());
    REQUIRE(validate_prefix("my-type").is_err());
    REQUIRE(validate_prefix("my.type").is_err());
}

TEST_CASE("64-character prefix is rejected", "[validate]") {
    std::string p(64, 'a');
    auto r = validate_prefix(p);
    REQUIRE(r.is_err());
    REQUIRE(r.error().as<InvalidPrefixError>()->prefix == p);
}

// ===== Suffix =====

TEST_CASE("valid suffixes pass", "[validate]") {
    REQUIRE(validate_suffix("00041061050r3gg28a1c60t3gf").is_ok());
    REQUIRE(validate_suffix("7zzzzzzzzzzzzzzzzzzzzzzzzz").is_ok());
}

TEST_CASE("suffix length is checked first", "[validate]") {
    // Also has bad characters; length wins
    auto r = validate_suffix("UUU");
    REQUIRE(r.is_err());
    REQUIRE(r.error() == TidError::invalid_suffix_length(3));

    REQUIRE(validate_suffix("").error() == TidError::invalid_suffix_length(0));
    REQUIRE(validate_suffix(std::string(27, '0')).error() ==
            TidError::invalid_suffix_length(27));
}

TEST_CASE("first bad character is reported", "[validate]") {
    auto r = validate_suffix("0000000000l0000000000000u0");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TidError::InvalidSuffixCharacter);
    REQUIRE(r.error().as<InvalidSuffixCharacterError>()->character == 'l');
}

TEST_CASE("character check comes before range check", "[validate]") {
    // First symbol overflows, but 'o' is reported since it is not in the alphabet
    auto r = validate_suffix("z000000000000000000000000o");
    REQUIRE(r.error() == TidError::invalid_suffix_character('o'));
}

TEST_CASE("first symbol above 7 is rejected", "[validate]") {
    for (char c : std::string("89abcdefghjkmnpqrstvwxyz")) {
        std::string s = std::string(1, c) + std::string(25, '0');
        auto r = validate_suffix(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error() == TidError::invalid_suffix_character(c));
    }
}
