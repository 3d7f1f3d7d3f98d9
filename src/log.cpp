// =============================================================================
// log.cpp - Leveled stderr Logging
// =============================================================================

#include "crowdsale/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace crowdsale {
namespace log {

namespace {

std::atomic<Level> current_level{Level::INFO};
std::mutex write_mutex;

std::string utc_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // anonymous namespace

void set_level(Level level) {
    current_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return current_level.load(std::memory_order_relaxed);
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::OFF: return "off";
    }
    return "unknown";
}

bool enabled(Level level) {
    return level != Level::OFF && level >= current_level.load(std::memory_order_relaxed);
}

void write(Level level, const std::string& message) {
    if (!enabled(level)) return;

    std::string stamp = utc_now();
    std::lock_guard<std::mutex> lock(write_mutex);
    std::cerr << stamp << " [" << level_name(level) << "] " << message << "\n";
}

} // namespace log
} // namespace crowdsale
