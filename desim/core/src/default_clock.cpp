#include <desim/core/default_clock.hpp>

#include <memory>
#include <mutex>

namespace desim::core {

namespace {

std::mutex default_mutex;
std::unique_ptr<Clock> default_instance;

} // anonymous namespace

Clock& default_clock() {
    std::lock_guard<std::mutex> lock(default_mutex);
    if (!default_instance) {
        default_instance = std::make_unique<Clock>(ClockConfig{});
    }
    return *default_instance;
}

Clock& reset_default_clock(const ClockConfig& config) {
    std::lock_guard<std::mutex> lock(default_mutex);
    default_instance.reset();
    default_instance = std::make_unique<Clock>(config);
    return *default_instance;
}

} // namespace desim::core
