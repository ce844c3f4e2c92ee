#include <desim/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace desim::core {

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (LogLevel level : {LogLevel::Error, LogLevel::Warn, LogLevel::Info,
                           LogLevel::Debug, LogLevel::Trace, LogLevel::Off}) {
        if (upper == log_level_name(level)) {
            return level;
        }
    }
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return level_.load(std::memory_order_relaxed);
}

void Logger::set_sink(FILE* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_ == nullptr) {
        return;
    }
    fmt::print(sink_, "[{}] {}\n", log_level_name(level), line);
    std::fflush(sink_);
}

} // namespace desim::core
