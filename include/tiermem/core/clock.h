#ifndef TIERMEM_CORE_CLOCK_H_
#define TIERMEM_CORE_CLOCK_H_

#include <memory>

#include "tiermem/core/types.h"

namespace tiermem {
namespace core {

/**
 * @brief Source of wall-clock timestamps for created_at / last_referenced_at
 *
 * Components receive a clock instead of calling system_clock directly so that
 * aging and retention behavior can be driven deterministically.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

std::shared_ptr<Clock> default_clock();

} // namespace core
} // namespace tiermem

#endif // TIERMEM_CORE_CLOCK_H_
