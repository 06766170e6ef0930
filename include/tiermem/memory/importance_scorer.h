#pragma once

#include "tiermem/core/config.h"
#include "tiermem/core/result.h"
#include "tiermem/core/types.h"

namespace tiermem {
namespace memory {

/**
 * @brief Computes the importance of a conversational turn
 *
 * importance = w_n * novelty + w_s * sentiment + w_f * feedback
 *              + w_r * ln(1 + recurrence_count)
 *
 * The result is clamped to [0, max_importance]. The scorer holds no state
 * besides its weights, so one instance can be shared across threads.
 */
class ImportanceScorer {
public:
    explicit ImportanceScorer(const core::ImportanceConfig& config = core::ImportanceConfig::Default());

    /**
     * @brief Scores raw signal values
     * @return INVALID_ARGUMENT if any input is NaN, infinite or outside [0, input_max]
     */
    core::Result<double> score(double semantic_novelty,
                               double sentiment_intensity,
                               double user_feedback,
                               uint32_t recurrence_count) const;

    core::Result<double> score(const core::ImportanceSignals& signals) const;

    /**
     * @brief Checks signals without scoring them
     */
    core::Result<void> validate(const core::ImportanceSignals& signals) const;

    const core::ImportanceConfig& config() const { return config_; }

private:
    core::Result<void> check_input(const char* name, double value) const;

    core::ImportanceConfig config_;
};

} // namespace memory
} // namespace tiermem
