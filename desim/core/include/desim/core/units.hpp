#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>

namespace desim::core {

/// @brief Unit attached to a clock or to a dimensioned time value.
///
/// `None` means "bare number": a clock without a unit interprets every
/// time as a plain magnitude.
///
/// @ingroup core_types
enum class TimeUnit : uint8_t {
    None,
    Nanoseconds,
    Microseconds,
    Milliseconds,
    Seconds,
    Minutes,
    Hours,
    Days,
};

/// @brief Length of @p unit expressed in seconds.
/// @return Seconds per unit, or 1.0 for TimeUnit::None.
/// @ingroup core_types
constexpr double unit_in_seconds(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::Nanoseconds:  return 1e-9;
        case TimeUnit::Microseconds: return 1e-6;
        case TimeUnit::Milliseconds: return 1e-3;
        case TimeUnit::Seconds:      return 1.0;
        case TimeUnit::Minutes:      return 60.0;
        case TimeUnit::Hours:        return 3600.0;
        case TimeUnit::Days:         return 86400.0;
        case TimeUnit::None:
        default:                     return 1.0;
    }
}

/// @brief Short symbol for a unit ("ns", "s", "min", ...), empty for None.
std::string_view unit_symbol(TimeUnit unit) noexcept;

/// @brief Parse a unit symbol or name ("ms", "seconds", "none", ...).
/// @return The unit, or std::nullopt if the text names no unit.
std::optional<TimeUnit> parse_unit(std::string_view text) noexcept;

/// @brief A time magnitude together with its unit.
///
/// Passing a Time to a Clock makes the clock convert it into its own
/// unit before use.
///
/// @see convert, Clock::to_clock_time
/// @ingroup core_types
struct Time {
    double value{0.0};
    TimeUnit unit{TimeUnit::None};

    constexpr auto operator<=>(const Time&) const = default;
};

/// @brief Convert @p t into @p target.
///
/// Conversion between two real units scales the magnitude. If either
/// side is TimeUnit::None the magnitude is returned unchanged.
///
/// @ingroup core_types
constexpr double convert(Time t, TimeUnit target) noexcept {
    if (t.unit == TimeUnit::None || target == TimeUnit::None || t.unit == target) {
        return t.value;
    }
    return t.value * unit_in_seconds(t.unit) / unit_in_seconds(target);
}

/// @name Time factories
/// @{
constexpr Time nanoseconds(double v) noexcept { return Time{v, TimeUnit::Nanoseconds}; }
constexpr Time microseconds(double v) noexcept { return Time{v, TimeUnit::Microseconds}; }
constexpr Time milliseconds(double v) noexcept { return Time{v, TimeUnit::Milliseconds}; }
constexpr Time seconds(double v) noexcept { return Time{v, TimeUnit::Seconds}; }
constexpr Time minutes(double v) noexcept { return Time{v, TimeUnit::Minutes}; }
constexpr Time hours(double v) noexcept { return Time{v, TimeUnit::Hours}; }
constexpr Time days(double v) noexcept { return Time{v, TimeUnit::Days}; }
/// @}

} // namespace desim::core
