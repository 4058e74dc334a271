#include <tid/log.hpp>
#include <cstdarg>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace tid::log {

static Level s_level = Info;
static std::FILE* s_out = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* output() {
    return s_out ? s_out : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(output()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

static const struct {
    Level level;
    const char* name;
    const char* color;
} LEVELS[] = {
    {Trace, "trace", "\033[90m"},   // gray
    {Debug, "debug", "\033[36m"},   // cyan
    {Info,  "info",  "\033[32m"},   // green
    {Warn,  "warn",  "\033[33m"},   // yellow
    {Error, "error", "\033[31m"},   // red
};

const char* level_name(Level lvl) {
    for (const auto& l : LEVELS) {
        if (l.level == lvl) return l.name;
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    for (const auto& l : LEVELS) {
        if (name == l.name) return Result<Level>::ok(l.level);
    }
    return TidError{TidError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(std::FILE* out) {
    s_out = out;
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    std::FILE* out = output();
    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", LEVELS[lvl].color, level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

#define TID_LOG_FN(name, lvl)              \
    void name(const char* fmt, ...) {      \
        va_list args;                      \
        va_start(args, fmt);               \
        log_message(lvl, fmt, args);       \
        va_end(args);                      \
    }

TID_LOG_FN(trace, Trace)
TID_LOG_FN(debug, Debug)
TID_LOG_FN(info, Info)
TID_LOG_FN(warn, Warn)
TID_LOG_FN(error, Error)

#undef TID_LOG_FN

} // namespace tid::log
