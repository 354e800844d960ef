#include "bled112_driver/log.hpp"
#include <iostream>

namespace bgapi {

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void defaultLogHandler(LogLevel level, const std::string& message) {
    if (level < LogLevel::WARN) {
        return;
    }
    std::cerr << "[bgapi] " << toString(level) << ": " << message << std::endl;
}

} // namespace bgapi
