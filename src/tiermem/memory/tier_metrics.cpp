#include "tiermem/memory/tier_metrics.h"

#include <iomanip>
#include <sstream>

namespace tiermem {
namespace memory {

namespace {

constexpr auto kOrder = std::memory_order_relaxed;

size_t index_of(core::Tier tier) {
    return static_cast<size_t>(tier);
}

} // namespace

void TierMetrics::recordWrite(core::Tier tier) {
    tiers_[index_of(tier)].writes.fetch_add(1, kOrder);
}

void TierMetrics::recordHit(core::Tier tier) {
    tiers_[index_of(tier)].hits.fetch_add(1, kOrder);
}

void TierMetrics::recordMiss(core::Tier tier) {
    tiers_[index_of(tier)].misses.fetch_add(1, kOrder);
}

void TierMetrics::recordEviction(core::Tier tier) {
    tiers_[index_of(tier)].evictions.fetch_add(1, kOrder);
}

void TierMetrics::recordTransition(core::Tier from, core::Tier to) {
    recordEviction(from);
    recordWrite(to);
    if (to == core::Tier::WARM) {
        promotions_to_warm_.fetch_add(1, kOrder);
    } else if (to == core::Tier::COLD) {
        demotions_to_cold_.fetch_add(1, kOrder);
    }
}

void TierMetrics::recordDrop() {
    drops_.fetch_add(1, kOrder);
}

void TierMetrics::recordRedaction() {
    redactions_.fetch_add(1, kOrder);
}

void TierMetrics::recordIntegrityFailure() {
    integrity_failures_.fetch_add(1, kOrder);
}

void TierMetrics::recordRejectedInput() {
    rejected_inputs_.fetch_add(1, kOrder);
}

void TierMetrics::recordRecordLatency(uint64_t duration_ns) {
    record_count_.fetch_add(1, kOrder);
    total_record_time_ns_.fetch_add(duration_ns, kOrder);
}

void TierMetrics::recordRecallLatency(uint64_t duration_ns) {
    recall_count_.fetch_add(1, kOrder);
    total_recall_time_ns_.fetch_add(duration_ns, kOrder);
}

TierMetrics::MetricsSnapshot TierMetrics::getSnapshot() const {
    MetricsSnapshot snapshot;
    for (size_t i = 0; i < kTierCount; ++i) {
        snapshot.tiers[i].writes = tiers_[i].writes.load(kOrder);
        snapshot.tiers[i].hits = tiers_[i].hits.load(kOrder);
        snapshot.tiers[i].misses = tiers_[i].misses.load(kOrder);
        snapshot.tiers[i].evictions = tiers_[i].evictions.load(kOrder);
    }
    snapshot.promotions_to_warm = promotions_to_warm_.load(kOrder);
    snapshot.demotions_to_cold = demotions_to_cold_.load(kOrder);
    snapshot.drops = drops_.load(kOrder);
    snapshot.redactions = redactions_.load(kOrder);
    snapshot.integrity_failures = integrity_failures_.load(kOrder);
    snapshot.rejected_inputs = rejected_inputs_.load(kOrder);
    snapshot.record_count = record_count_.load(kOrder);
    snapshot.recall_count = recall_count_.load(kOrder);
    snapshot.total_record_time_ns = total_record_time_ns_.load(kOrder);
    snapshot.total_recall_time_ns = total_recall_time_ns_.load(kOrder);

    const TierCounters& hot = snapshot.tier(core::Tier::HOT);
    uint64_t lookups = hot.hits + hot.misses;
    if (lookups > 0) {
        snapshot.hot_hit_ratio = static_cast<double>(hot.hits) / lookups * 100.0;
    }
    if (snapshot.record_count > 0) {
        snapshot.average_record_latency_ns =
            static_cast<double>(snapshot.total_record_time_ns) / snapshot.record_count;
    }
    if (snapshot.recall_count > 0) {
        snapshot.average_recall_latency_ns =
            static_cast<double>(snapshot.total_recall_time_ns) / snapshot.recall_count;
    }
    return snapshot;
}

void TierMetrics::reset() {
    for (auto& tier : tiers_) {
        tier.writes.store(0, kOrder);
        tier.hits.store(0, kOrder);
        tier.misses.store(0, kOrder);
        tier.evictions.store(0, kOrder);
    }
    promotions_to_warm_.store(0, kOrder);
    demotions_to_cold_.store(0, kOrder);
    drops_.store(0, kOrder);
    redactions_.store(0, kOrder);
    integrity_failures_.store(0, kOrder);
    rejected_inputs_.store(0, kOrder);
    record_count_.store(0, kOrder);
    recall_count_.store(0, kOrder);
    total_record_time_ns_.store(0, kOrder);
    total_recall_time_ns_.store(0, kOrder);
}

std::string TierMetrics::getFormattedMetrics() const {
    MetricsSnapshot s = getSnapshot();
    std::ostringstream oss;
    oss << "Tier Metrics:\n";
    for (core::Tier tier : {core::Tier::HOT, core::Tier::WARM, core::Tier::COLD}) {
        const TierCounters& c = s.tier(tier);
        oss << "  " << core::tier_name(tier) << ": writes=" << c.writes << " hits=" << c.hits
            << " misses=" << c.misses << " evictions=" << c.evictions << "\n";
    }
    oss << "  Transitions: " << s.promotions_to_warm << " to warm, " << s.demotions_to_cold
        << " to cold, " << s.drops << " dropped\n";
    oss << "  Redactions: " << s.redactions << ", integrity failures: " << s.integrity_failures
        << ", rejected inputs: " << s.rejected_inputs << "\n";
    oss << std::fixed << std::setprecision(2);
    oss << "  Hot hit ratio: " << s.hot_hit_ratio << "%\n";
    oss << "  Avg record latency: " << s.average_record_latency_ns / 1000.0 << " us ("
        << s.record_count << " calls)\n";
    oss << "  Avg recall latency: " << s.average_recall_latency_ns / 1000.0 << " us ("
        << s.recall_count << " calls)\n";
    return oss.str();
}

} // namespace memory
} // namespace tiermem
