#include "tiermem/memory/importance_scorer.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tiermem {
namespace memory {

ImportanceScorer::ImportanceScorer(const core::ImportanceConfig& config)
    : config_(config) {
    if (!(config_.input_max > 0.0) || !(config_.max_importance > 0.0)) {
        throw core::InvalidArgumentError("Importance bounds must be positive");
    }
}

core::Result<void> ImportanceScorer::check_input(const char* name, double value) const {
    if (!std::isfinite(value) || value < 0.0 || value > config_.input_max) {
        std::ostringstream oss;
        oss << name << " must be a finite value in [0, " << config_.input_max
            << "], got " << value;
        return core::Result<void>::error(oss.str(), core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

core::Result<void> ImportanceScorer::validate(const core::ImportanceSignals& signals) const {
    auto novelty = check_input("semantic_novelty", signals.semantic_novelty);
    if (!novelty.ok()) return novelty;
    auto sentiment = check_input("sentiment_intensity", signals.sentiment_intensity);
    if (!sentiment.ok()) return sentiment;
    return check_input("user_feedback", signals.user_feedback);
}

core::Result<double> ImportanceScorer::score(double semantic_novelty,
                                             double sentiment_intensity,
                                             double user_feedback,
                                             uint32_t recurrence_count) const {
    core::ImportanceSignals signals;
    signals.semantic_novelty = semantic_novelty;
    signals.sentiment_intensity = sentiment_intensity;
    signals.user_feedback = user_feedback;
    signals.recurrence_count = recurrence_count;
    return score(signals);
}

core::Result<double> ImportanceScorer::score(const core::ImportanceSignals& signals) const {
    auto valid = validate(signals);
    if (!valid.ok()) {
        return core::Result<double>::propagate(valid);
    }

    double raw = config_.novelty_weight * signals.semantic_novelty
               + config_.sentiment_weight * signals.sentiment_intensity
               + config_.feedback_weight * signals.user_feedback
               + config_.recurrence_weight * std::log1p(static_cast<double>(signals.recurrence_count));
    return core::Result<double>(std::clamp(raw, 0.0, config_.max_importance));
}

} // namespace memory
} // namespace tiermem
