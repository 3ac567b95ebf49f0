#pragma once

#include <functional>
#include <string>

namespace voicescope {

enum class LogLevel {
    Info,
    Warn,
    Error
};

// Receives fully formatted lines, e.g. "[Delivery Engine] [WARN] fallback: ..."
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

// Replace the process-wide sink. An empty sink restores console output.
// The sink is called without the sink lock held and may itself log. If it
// throws, the line goes to the console instead.
void set_log_sink(LogSink sink);

void log_message(LogLevel level, const std::string& component, const std::string& message);

inline void log_info(const std::string& component, const std::string& message) {
    log_message(LogLevel::Info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
    log_message(LogLevel::Warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
    log_message(LogLevel::Error, component, message);
}

const char* log_level_to_string(LogLevel level);

}  // namespace voicescope
