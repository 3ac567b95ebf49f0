#include "voicescope/Log.h"

#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace voicescope {

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

LogSink& current_sink() {
    static LogSink sink;
    return sink;
}

} // namespace

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
    const std::string line = "[" + component + "] [" + log_level_to_string(level) + "] " + message;

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        sink = current_sink();
    }
    // The sink runs unlocked so it may log or replace itself.
    if (sink) {
        try {
            sink(level, line);
            return;
        } catch (const std::exception& e) {
            std::cerr << "[Log] [ERROR] log sink failed: " << e.what() << std::endl;
        }
    }
    if (level == LogLevel::Info) {
        std::cout << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

}  // namespace voicescope
