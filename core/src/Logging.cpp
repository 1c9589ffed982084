#include "cutgraph/Logging.h"

#include <iostream>
#include <stdexcept>

namespace cutgraph {

namespace {

LogLevel g_level = LogLevel::Warning;

}  // namespace

void set_log_level(LogLevel level) {
    g_level = level;
}

LogLevel log_level() {
    return g_level;
}

void log_message(LogLevel level, const std::string& tag, const std::string& message) {
    if (level == LogLevel::Off || level < g_level) {
        return;
    }
    std::cerr << "[" << tag << "] " << message << std::endl;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Error:
            return "error";
        case LogLevel::Off:
            return "off";
    }
    return "warning";
}

LogLevel log_level_from_string(const std::string& value) {
    if (value == "debug") {
        return LogLevel::Debug;
    }
    if (value == "info") {
        return LogLevel::Info;
    }
    if (value == "warning") {
        return LogLevel::Warning;
    }
    if (value == "error") {
        return LogLevel::Error;
    }
    if (value == "off") {
        return LogLevel::Off;
    }
    throw std::runtime_error("Unknown log level: " + value);
}

}  // namespace cutgraph
