#pragma once

#include <tid/log.hpp>
#include <tid/result.hpp>
#include <tid/typeid.hpp>
#include <optional>
#include <string>

namespace tid {

// Layered configuration: global (~/.typeid/config.toml) < local.
// Only fields a layer sets explicitly override the layers below it.
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;
    std::optional<std::string> default_prefix;
    std::optional<UuidVersion> uuid_version;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    std::string prefix_or_default() const { return default_prefix.value_or(""); }
    UuidVersion version_or_default() const { return uuid_version.value_or(UuidVersion::V7); }
};

// Push the [log] section into tid::log. Unset fields leave it alone.
void apply_logging(const Config& cfg);

// $HOME/.typeid/config.toml, or "" when no home directory is known
std::string global_config_path();

} // namespace tid
