// typeid_tool.cpp
//
// Command line front end for the tid library:
//
//     ./typeid_tool new [prefix]                   # fresh id (v7 unless configured)
//     ./typeid_tool encode <uuid> [prefix]         # uuid -> typeid
//     ./typeid_tool decode <typeid> [expected]     # typeid -> prefix, suffix, uuid
//
// Settings come from ~/.typeid/config.toml, overridden by ./typeid.toml.

#include <tid/config.hpp>
#include <tid/log.hpp>
#include <tid/result.hpp>
#include <tid/typeid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tid;

static const char* USAGE =
    "usage: typeid_tool new [prefix] | encode <uuid> [prefix] | decode <typeid> [expected-prefix]";

// A missing config file is fine; a broken one is not.
static Result<std::optional<Config>> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        log::trace("no config at '%s'", path.c_str());
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    TID_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

static Result<Config> load_config() {
    auto global = load_layer(global_config_path());
    TID_TRY(global);
    auto local = load_layer("typeid.toml");
    TID_TRY(local);
    return Result<Config>::ok(Config::effective(global.value(), local.value()));
}

static Result<std::string> cmd_new(const std::vector<std::string>& args, const Config& cfg) {
    std::string prefix = args.size() > 1 ? args[1] : cfg.prefix_or_default();
    auto id = TypeId::create(prefix, std::nullopt, cfg.version_or_default());
    TID_TRY(id);
    return Result<std::string>::ok(id.value().to_string());
}

static Result<std::string> cmd_encode(const std::vector<std::string>& args, const Config& cfg) {
    if (args.size() < 2) {
        return TidError{TidError::InvalidArg, "encode needs a uuid", USAGE};
    }
    std::string prefix = args.size() > 2 ? args[2] : cfg.prefix_or_default();
    auto id = TypeId::from_uuid(args[1], prefix);
    TID_TRY(id);
    return Result<std::string>::ok(id.value().to_string());
}

static Result<std::string> cmd_decode(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return TidError{TidError::InvalidArg, "decode needs a typeid", USAGE};
    }
    std::optional<std::string> expected;
    if (args.size() > 2) expected = args[2];

    auto id = TypeId::parse(args[1], expected);
    TID_TRY(id);
    const auto& v = id.value();
    return Result<std::string>::ok(
        "prefix: " + (v.prefix().empty() ? std::string("(none)") : v.prefix()) + "\n" +
        "suffix: " + v.suffix() + "\n" +
        "uuid:   " + v.to_uuid());
}

static Result<std::string> run(const std::vector<std::string>& args) {
    if (args.empty()) {
        return TidError{TidError::InvalidArg, "no command given", USAGE};
    }

    auto cfg = load_config();
    TID_TRY(cfg);
    apply_logging(cfg.value());

    const std::string& cmd = args[0];
    log::debug("command '%s'", cmd.c_str());
    if (cmd == "new") return cmd_new(args, cfg.value());
    if (cmd == "encode") return cmd_encode(args, cfg.value());
    if (cmd == "decode") return cmd_decode(args);

    return TidError{TidError::InvalidArg, "unknown command '" + cmd + "'", USAGE};
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto result = run(args);
    if (result.is_err()) {
        log::error("%s", result.error().format().c_str());
        return 1;
    }
    std::cout << result.value() << "\n";
    return 0;
}
