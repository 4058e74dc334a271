#include <catch2/catch.hpp>
#include <tid/typeid.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>
#include <string>

using namespace tid;

static std::string fixtures_dir() {
    const char* src = std::getenv("TID_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static toml::array load_cases(const std::string& file) {
    auto doc = toml::parse_file(fixtures_dir() + "/" + file);
    auto* cases = doc["case"].as_array();
    REQUIRE(cases != nullptr);
    REQUIRE_FALSE(cases->empty());
    return *cases;
}

TEST_CASE("valid fixtures parse and encode exactly", "[conformance]") {
    for (const auto& node : load_cases("valid.toml")) {
        const auto& c = *node.as_table();
        std::string name = c["name"].value_or(std::string());
        std::string text = c["typeid"].value_or(std::string());
        std::string prefix = c["prefix"].value_or(std::string());
        std::string uuid = c["uuid"].value_or(std::string());
        INFO("case " << name);

        auto parsed = TypeId::parse(text, prefix);
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().prefix() == prefix);
        REQUIRE(parsed.value().to_string() == text);
        REQUIRE(parsed.value().to_uuid() == uuid);

        auto encoded = TypeId::from_uuid(uuid, prefix);
        REQUIRE(encoded.is_ok());
        REQUIRE(encoded.value().to_string() == text);
        REQUIRE(encoded.value() == parsed.value());
    }
}

TEST_CASE("invalid fixtures are rejected with the expected code", "[conformance]") {
    for (const auto& node : load_cases("invalid.toml")) {
        const auto& c = *node.as_table();
        std::string name = c["name"].value_or(std::string());
        std::string text = c["typeid"].value_or(std::string());
        std::string code = c["code"].value_or(std::string());
        INFO("case " << name);

        auto r = TypeId::parse(text);
        REQUIRE(r.is_err());
        REQUIRE(std::string(TidError::code_name(r.error().code)) == code);
    }
}
