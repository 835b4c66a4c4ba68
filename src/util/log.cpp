#include "util/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include "util/errors.hpp"
#include "util/time.hpp"

namespace courserag::log {
namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<int>& threshold_storage() {
    static std::atomic<int> value{static_cast<int>(Level::Info)};
    return value;
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

void set_threshold(Level level) { threshold_storage().store(static_cast<int>(level)); }

Level threshold() { return static_cast<Level>(threshold_storage().load()); }

Level parse_level(std::string_view name) {
    if (name == "debug") {
        return Level::Debug;
    }
    if (name == "info") {
        return Level::Info;
    }
    if (name == "warn") {
        return Level::Warn;
    }
    if (name == "error") {
        return Level::Error;
    }
    throw ConfigError("unknown log level: " + std::string{name});
}

void write(Level level, std::string_view message) {
    if (static_cast<int>(level) < threshold_storage().load()) {
        return;
    }
    const std::string timestamp = time::current_time_iso8601();
    auto& stream = (level == Level::Warn || level == Level::Error) ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(log_mutex());
    stream << '[' << timestamp << "][" << to_string(level) << "] " << message << std::endl;
}

void debug(std::string_view message) { write(Level::Debug, message); }

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace courserag::log
