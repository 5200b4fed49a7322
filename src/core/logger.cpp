#include <engram/core/logger.hpp>
#include <ctime>
#include <cstring>
#include <unistd.h>

namespace engram {

namespace {

const char* RESET = "\033[0m";

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return RESET;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// "bool engram::ExperienceStore::record(const ...)" -> "ExperienceStore::record"
std::string short_function(const char* pretty_function) {
    std::string pf = pretty_function;
    size_t paren = pf.find('(');
    if (paren == std::string::npos) return pf;

    std::string sig = pf.substr(0, paren);
    size_t space = sig.rfind(' ');
    if (space != std::string::npos) sig = sig.substr(space + 1);
    while (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) sig.erase(0, 1);

    const char* ns = "engram::";
    if (sig.compare(0, strlen(ns), ns) == 0) sig.erase(0, strlen(ns));
    return sig;
}

// Path relative to src/ keeps debug lines short
const char* short_file(const char* file) {
    const char* p = strstr(file, "src/");
    return p ? p + 4 : file;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , color_(isatty(STDERR_FILENO) != 0)
{}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_color(bool enabled) { color_ = enabled; }

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    char message[2048];
    vsnprintf(message, sizeof(message), fmt, args);

    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    const char* on = color_ ? level_color(level) : "";
    const char* off = color_ ? RESET : "";

    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ == LogLevel::DEBUG) {
        fprintf(stderr, "[%s] %s[%s]%s (%s) at %s:%d %s\n",
                timestamp, on, level_name(level), off,
                short_function(func).c_str(), short_file(file), line, message);
    } else {
        fprintf(stderr, "[%s] %s[%s]%s %s\n", timestamp, on, level_name(level), off, message);
    }
    fflush(stderr);
}

} // namespace engram
