#include "tiermem/core/clock.h"

#include <chrono>

namespace tiermem {
namespace core {

Timestamp SystemClock::now() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::shared_ptr<Clock> default_clock() {
    return std::make_shared<SystemClock>();
}

} // namespace core
} // namespace tiermem
