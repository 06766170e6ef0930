/**
 * @file config.cpp
 * @brief Validation of EngineConfig
 *
 * Range checks are done once when the engine is constructed so the
 * individual tiers can trust their configuration.
 */

#include "tiermem/core/config.h"

#include <cmath>
#include <sstream>

namespace tiermem {
namespace core {

namespace {

Result<void> invalid(const std::string& message) {
    return Result<void>::error("invalid configuration: " + message,
                               Error::Code::INVALID_ARGUMENT);
}

bool is_weight(double w) {
    return std::isfinite(w) && w >= 0.0;
}

bool is_strength(double s) {
    return std::isfinite(s) && s >= 0.0 && s <= 1.0;
}

} // namespace

Result<void> EngineConfig::validate() const {
    if (!is_weight(importance.novelty_weight) || !is_weight(importance.sentiment_weight) ||
        !is_weight(importance.feedback_weight) || !is_weight(importance.recurrence_weight)) {
        return invalid("importance weights must be finite and non-negative");
    }
    if (!(importance.input_max > 0.0) || !(importance.max_importance > 0.0)) {
        return invalid("importance bounds must be positive");
    }

    if (hot.capacity_per_owner == 0) {
        return invalid("hot.capacity_per_owner must be greater than 0");
    }
    if (hot.max_age < 0) {
        return invalid("hot.max_age must not be negative");
    }

    if (warm.retention <= 0) {
        return invalid("warm.retention must be positive");
    }
    if (warm.max_context_nodes == 0) {
        return invalid("warm.max_context_nodes must be greater than 0");
    }
    if (!is_strength(warm.mention_strength) || !is_strength(warm.topic_strength) ||
        !is_strength(warm.entity_topic_strength) || !is_strength(warm.co_mention_strength) ||
        !is_strength(warm.reinforce_step)) {
        return invalid("warm edge strengths must lie in [0, 1]");
    }

    if (!(cold.delta_similarity_threshold > 0.0) || cold.delta_similarity_threshold > 1.0) {
        return invalid("cold.delta_similarity_threshold must lie in (0, 1]");
    }
    if (cold.max_persist_attempts == 0) {
        return invalid("cold.max_persist_attempts must be at least 1");
    }

    if (privacy.placeholder.empty()) {
        return invalid("privacy.placeholder must not be empty");
    }

    if (controller.retention_floor < 0.0 ||
        controller.warm_threshold < controller.retention_floor) {
        std::ostringstream oss;
        oss << "expected 0 <= retention_floor (" << controller.retention_floor
            << ") <= warm_threshold (" << controller.warm_threshold << ")";
        return invalid(oss.str());
    }
    if (controller.recall_limit == 0) {
        return invalid("controller.recall_limit must be greater than 0");
    }
    if (controller.access_bonus_rate < 0.0 || controller.access_bonus_cap < 0.0) {
        return invalid("controller access bonus must not be negative");
    }
    if (controller.recency_window <= 0) {
        return invalid("controller.recency_window must be positive");
    }
    if (controller.enable_background_maintenance &&
        controller.maintenance_interval.count() <= 0) {
        return invalid("controller.maintenance_interval must be positive");
    }
    return Result<void>();
}

} // namespace core
} // namespace tiermem
