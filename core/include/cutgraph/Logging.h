#pragma once

#include <string>

namespace cutgraph {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

// Messages below the current level are dropped. Default: Warning.
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[tag] message" to stderr.
void log_message(LogLevel level, const std::string& tag, const std::string& message);

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& value);

}  // namespace cutgraph
