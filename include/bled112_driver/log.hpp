#ifndef BLED112_DRIVER_LOG_HPP
#define BLED112_DRIVER_LOG_HPP

#include <functional>
#include <string>

namespace bgapi {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Receives driver diagnostics; called from the driver's own threads
using LogHandler = std::function<void(LogLevel level, const std::string& message)>;

const char* toString(LogLevel level);

// Writes WARN and ERROR messages to std::cerr, drops the rest
void defaultLogHandler(LogLevel level, const std::string& message);

} // namespace bgapi

#endif // BLED112_DRIVER_LOG_HPP
