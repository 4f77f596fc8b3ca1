#include "util/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "util/time.hpp"

namespace verirag::log {
namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<int>& min_level() {
    static std::atomic<int> level{static_cast<int>(Level::Info)};
    return level;
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

}  // namespace

Level parse_level(std::string_view name) {
    std::string lower;
    for (const char ch : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "error") {
        return Level::Error;
    }
    throw std::invalid_argument("unknown log level: " + std::string{name});
}

void set_min_level(Level level) { min_level().store(static_cast<int>(level)); }

bool enabled(Level level) { return static_cast<int>(level) >= min_level().load(); }

void write(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    const std::string timestamp = time::current_time_iso8601();
    // Warnings and errors go to stderr so stdout stays usable for CLI output.
    auto& stream = (level == Level::Debug || level == Level::Info) ? std::cout : std::cerr;

    std::lock_guard<std::mutex> lock(log_mutex());
    stream << '[' << timestamp << "][" << to_string(level) << "] " << message << std::endl;
}

void debug(std::string_view message) { write(Level::Debug, message); }

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace verirag::log
