#ifndef CROWDSALE_LOG_HPP
#define CROWDSALE_LOG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace crowdsale {
namespace log {

enum class Level : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

void set_level(Level level);
Level level();

// "trace" | "debug" | "info" | "warn" | "error" | "off"
std::optional<Level> parse_level(std::string_view name);
const char* level_name(Level level);

bool enabled(Level level);

// Writes "<UTC time> [level] message" to stderr
void write(Level level, const std::string& message);

inline void trace(const std::string& message) { write(Level::TRACE, message); }
inline void debug(const std::string& message) { write(Level::DEBUG, message); }
inline void info(const std::string& message) { write(Level::INFO, message); }
inline void warn(const std::string& message) { write(Level::WARN, message); }
inline void error(const std::string& message) { write(Level::ERROR, message); }

} // namespace log
} // namespace crowdsale

#endif // CROWDSALE_LOG_HPP
