#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace desim::core {

/// @brief Severity of a log line. Lower values are more severe.
/// @ingroup core
enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4,
    Off = 255,
};

/// @brief Upper-case level name ("WARN", ...).
[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

/// @brief Parse a level name, case-insensitive ("warn", "INFO", "off").
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// @brief True if a message of level @p msg passes a logger set to @p configured.
[[nodiscard]] constexpr bool log_enabled(LogLevel configured, LogLevel msg) noexcept {
    if (configured == LogLevel::Off) {
        return false;
    }
    return static_cast<uint8_t>(msg) <= static_cast<uint8_t>(configured);
}

/// @brief Process-wide leveled logger.
///
/// Lines are formatted with {fmt} and written to a `FILE*` sink under a
/// mutex, so worker threads can log concurrently. Clock diagnostics
/// carry the clock id and the virtual time of the emitting clock:
///
/// @code
/// [WARN] [clock 1 @ 2.5] undefined transition with Idle and Resume
/// @endcode
///
/// The logger does not own the sink. Passing nullptr discards output.
///
/// @ingroup core
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept;

    void set_sink(FILE* sink);

    /// @brief Log a line tagged with a clock id and its virtual time.
    template<typename... Args>
    void log(LogLevel level, int clock_id, double time,
             fmt::format_string<Args...> format, Args&&... args) {
        if (!log_enabled(level_.load(std::memory_order_relaxed), level)) {
            return;
        }
        write(level, fmt::format("[clock {} @ {}] ", clock_id, time)
                         + fmt::format(format, std::forward<Args>(args)...));
    }

    /// @brief Log a line without clock context.
    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (!log_enabled(level_.load(std::memory_order_relaxed), level)) {
            return;
        }
        write(level, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    Logger() = default;

    void write(LogLevel level, const std::string& line);

    mutable std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Warn};
    FILE* sink_{stderr};
};

} // namespace desim::core
