#include <desim/core/units.hpp>

#include <array>

namespace desim::core {

namespace {

struct UnitName {
    std::string_view name;
    TimeUnit unit;
};

constexpr std::array<UnitName, 23> UNIT_NAMES{{
    {"none", TimeUnit::None},
    {"", TimeUnit::None},
    {"ns", TimeUnit::Nanoseconds},
    {"nanoseconds", TimeUnit::Nanoseconds},
    {"us", TimeUnit::Microseconds},
    {"μs", TimeUnit::Microseconds},
    {"microseconds", TimeUnit::Microseconds},
    {"ms", TimeUnit::Milliseconds},
    {"milliseconds", TimeUnit::Milliseconds},
    {"s", TimeUnit::Seconds},
    {"sec", TimeUnit::Seconds},
    {"seconds", TimeUnit::Seconds},
    {"min", TimeUnit::Minutes},
    {"minute", TimeUnit::Minutes},
    {"minutes", TimeUnit::Minutes},
    {"hr", TimeUnit::Hours},
    {"h", TimeUnit::Hours},
    {"hour", TimeUnit::Hours},
    {"hours", TimeUnit::Hours},
    {"d", TimeUnit::Days},
    {"day", TimeUnit::Days},
    {"days", TimeUnit::Days},
    {"second", TimeUnit::Seconds},
}};

} // anonymous namespace

std::string_view unit_symbol(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::Nanoseconds:  return "ns";
        case TimeUnit::Microseconds: return "us";
        case TimeUnit::Milliseconds: return "ms";
        case TimeUnit::Seconds:      return "s";
        case TimeUnit::Minutes:      return "min";
        case TimeUnit::Hours:        return "hr";
        case TimeUnit::Days:         return "d";
        case TimeUnit::None:
        default:                     return "";
    }
}

std::optional<TimeUnit> parse_unit(std::string_view text) noexcept {
    for (const auto& entry : UNIT_NAMES) {
        if (entry.name == text) {
            return entry.unit;
        }
    }
    return std::nullopt;
}

} // namespace desim::core
