#include <progression/core/clock.hpp>
#include <chrono>

namespace progression::core {

uint64_t SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

IClock& system_clock() {
    static SystemClock s_instance;
    return s_instance;
}

} // namespace progression::core
