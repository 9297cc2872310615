#include <fillin/log.hpp>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace fillin::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::FILE* s_output = nullptr;

static std::FILE* output() {
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

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(std::FILE* out) {
    s_output = out;
}

std::FILE* get_output() {
    return output();
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

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Trace;
    if (name == "debug") return Debug;
    if (name == "info") return Info;
    if (name == "warn" || name == "warning") return Warn;
    if (name == "error") return Error;
    return std::nullopt;
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

    std::FILE* out = output();
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

} // namespace fillin::log
