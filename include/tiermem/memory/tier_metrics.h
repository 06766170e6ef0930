#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "tiermem/core/types.h"

namespace tiermem {
namespace memory {

/**
 * @brief Lock-free counters of tier activity
 *
 * Counts writes, hits, misses and evictions per tier, tier transitions and
 * latencies of the two public paths (record and recall). Relaxed ordering is
 * used throughout; a snapshot is not a consistent cut.
 */
class TierMetrics {
public:
    static constexpr size_t kTierCount = 3;

    struct TierCounters {
        uint64_t writes = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;     // items that left the tier
    };

    struct MetricsSnapshot {
        std::array<TierCounters, kTierCount> tiers{};

        uint64_t promotions_to_warm = 0;
        uint64_t demotions_to_cold = 0;
        uint64_t drops = 0;
        uint64_t redactions = 0;
        uint64_t integrity_failures = 0;
        uint64_t rejected_inputs = 0;

        uint64_t record_count = 0;
        uint64_t recall_count = 0;
        uint64_t total_record_time_ns = 0;
        uint64_t total_recall_time_ns = 0;

        // Calculated metrics
        double hot_hit_ratio = 0.0;
        double average_record_latency_ns = 0.0;
        double average_recall_latency_ns = 0.0;

        const TierCounters& tier(core::Tier t) const { return tiers[static_cast<size_t>(t)]; }
    };

    TierMetrics() = default;

    TierMetrics(const TierMetrics&) = delete;
    TierMetrics& operator=(const TierMetrics&) = delete;

    void recordWrite(core::Tier tier);
    void recordHit(core::Tier tier);
    void recordMiss(core::Tier tier);
    void recordEviction(core::Tier tier);

    /**
     * @brief Track an item moving between tiers
     */
    void recordTransition(core::Tier from, core::Tier to);
    void recordDrop();

    void recordRedaction();
    void recordIntegrityFailure();
    void recordRejectedInput();

    void recordRecordLatency(uint64_t duration_ns);
    void recordRecallLatency(uint64_t duration_ns);

    MetricsSnapshot getSnapshot() const;
    void reset();
    std::string getFormattedMetrics() const;

private:
    struct AtomicTierCounters {
        std::atomic<uint64_t> writes{0};
        std::atomic<uint64_t> hits{0};
        std::atomic<uint64_t> misses{0};
        std::atomic<uint64_t> evictions{0};
    };

    std::array<AtomicTierCounters, kTierCount> tiers_;

    std::atomic<uint64_t> promotions_to_warm_{0};
    std::atomic<uint64_t> demotions_to_cold_{0};
    std::atomic<uint64_t> drops_{0};
    std::atomic<uint64_t> redactions_{0};
    std::atomic<uint64_t> integrity_failures_{0};
    std::atomic<uint64_t> rejected_inputs_{0};

    std::atomic<uint64_t> record_count_{0};
    std::atomic<uint64_t> recall_count_{0};
    std::atomic<uint64_t> total_record_time_ns_{0};
    std::atomic<uint64_t> total_recall_time_ns_{0};
};

/**
 * @brief Measures elapsed steady-clock time
 */
class ScopedTimer {
public:
    ScopedTimer() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_ns() const {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_).count());
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace memory
} // namespace tiermem
