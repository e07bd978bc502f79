#include <plume/log.hpp>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace plume::log {

static Level s_level = Info;
static FILE* s_output = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static FILE* output() {
    return s_output ? s_output : stderr;
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

bool enabled(Level lvl) {
    return lvl >= s_level;
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info")  return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);
    return PlumeError{PlumeError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void init_from_env() {
    const char* env = std::getenv("PLUME_LOG");
    if (!env || !*env) return;
    auto lvl = parse_level(env);
    if (lvl.is_err()) {
        warn("ignoring PLUME_LOG: %s", lvl.error().message.c_str());
        return;
    }
    set_level(lvl.value());
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(FILE* out) {
    s_output = out;
    s_color_initialized = false;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();
    FILE* out = output();

    if (s_color_enabled) {
        std::fprintf(out, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace plume::log
