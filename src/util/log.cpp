#include <stash/log.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <unistd.h>

namespace stash::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::FILE* s_file = nullptr;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);

    return StashError{StashError::InvalidArg,
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

Status set_log_file(const std::string& path) {
    if (s_file) {
        std::fclose(s_file);
        s_file = nullptr;
    }
    if (path.empty()) return ok_status();

    s_file = std::fopen(path.c_str(), "a");
    if (!s_file) {
        return StashError{StashError::IO,
            "cannot open log file " + path + ": " + std::strerror(errno)};
    }
    return ok_status();
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

    // The file sink consumes its own copy of the argument list
    va_list file_args;
    va_copy(file_args, args);

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");

    if (s_file) {
        char stamp[32];
        std::time_t now = std::time(nullptr);
        std::tm tm_utc{};
        gmtime_r(&now, &tm_utc);
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);

        std::fprintf(s_file, "%s %s: ", stamp, level_name(lvl));
        std::vfprintf(s_file, fmt, file_args);
        std::fprintf(s_file, "\n");
        std::fflush(s_file);
    }
    va_end(file_args);
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

} // namespace stash::log
