#include <tid/config.hpp>
#include <tid/validate.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tid {

static Result<UuidVersion> parse_uuid_version(const std::string& s) {
    if (s == "v7") return Result<UuidVersion>::ok(UuidVersion::V7);
    if (s == "v4") return Result<UuidVersion>::ok(UuidVersion::V4);
    return TidError{TidError::Config,
        "unknown uuid-version '" + s + "'",
        "expected \"v7\" or \"v4\""};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TidError{TidError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto logt = doc["log"].as_table()) {
        if (auto v = (*logt)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
        if (auto v = (*logt)["color"].value<bool>()) {
            cfg.log_color = *v;
        }
    }

    // [typeid] section
    if (auto tt = doc["typeid"].as_table()) {
        if (auto v = (*tt)["default-prefix"].value<std::string>()) {
            TID_TRY(validate_prefix(*v));
            cfg.default_prefix = std::string(*v);
        }
        if (auto v = (*tt)["uuid-version"].value<std::string>()) {
            auto ver = parse_uuid_version(*v);
            if (ver.is_err()) return std::move(ver).error();
            cfg.uuid_version = ver.value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TidError{TidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loading config %s", path.c_str());
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.default_prefix) default_prefix = other.default_prefix;
    if (other.uuid_version) uuid_version = other.uuid_version;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void apply_logging(const Config& cfg) {
    if (cfg.log_level) log::set_level(*cfg.log_level);
    if (cfg.log_color) log::set_color_enabled(*cfg.log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.typeid/config.toml";
}

} // namespace tid
