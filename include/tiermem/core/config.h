#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "tiermem/core/types.h"
#include "tiermem/core/result.h"

namespace tiermem {
namespace core {

/**
 * @brief Weights and bounds of the importance function
 */
struct ImportanceConfig {
    double novelty_weight;      // weight of semantic novelty
    double sentiment_weight;    // weight of sentiment intensity
    double feedback_weight;     // weight of explicit user feedback
    double recurrence_weight;   // scales ln(1 + recurrence_count)
    double input_max;           // inputs are expected in [0, input_max]
    double max_importance;      // final clamp

    ImportanceConfig() : novelty_weight(0.0), sentiment_weight(0.0), feedback_weight(0.0),
                         recurrence_weight(0.0), input_max(0.0), max_importance(0.0) {}

    static ImportanceConfig Default() {
        ImportanceConfig config;
        config.novelty_weight = 0.35;
        config.sentiment_weight = 0.30;
        config.feedback_weight = 0.20;
        config.recurrence_weight = 0.80;
        config.input_max = 10.0;
        config.max_importance = 10.0;
        return config;
    }
};

/**
 * @brief Configuration for the hot (recency) tier
 */
struct HotCacheConfig {
    size_t capacity_per_owner;  // N most recent items kept per owner
    double hot_floor;           // evicted items at or above this importance are promoted
    Duration max_age;           // age bound applied by evict_expired(), 0 disables it

    HotCacheConfig() : capacity_per_owner(0), hot_floor(0.0), max_age(0) {}

    static HotCacheConfig Default() {
        HotCacheConfig config;
        config.capacity_per_owner = 20;         // last 20 conversation turns
        config.hot_floor = 5.0;
        config.max_age = 3'600'000;             // 1 hour
        return config;
    }
};

/**
 * @brief Configuration for the warm (graph) tier
 */
struct WarmGraphConfig {
    Duration retention;                 // warm items older than this are demoted to cold
    uint32_t default_max_hops;          // traversal depth for recall
    size_t max_context_nodes;           // cap on nodes returned by query_context
    size_t summary_excerpt_chars;       // characters of each turn kept in a summary
    size_t summary_max_chars;           // summary payloads are truncated to this size

    // Edge strengths created by absorb()
    double mention_strength;            // summary -> entity
    double topic_strength;              // summary -> topic
    double entity_topic_strength;       // entity -> topic
    double co_mention_strength;         // entity -> entity within one turn
    double reinforce_step;              // added when an existing edge is seen again

    WarmGraphConfig() : retention(0), default_max_hops(0), max_context_nodes(0),
                        summary_excerpt_chars(0), summary_max_chars(0),
                        mention_strength(0.0), topic_strength(0.0),
                        entity_topic_strength(0.0), co_mention_strength(0.0),
                        reinforce_step(0.0) {}

    static WarmGraphConfig Default() {
        WarmGraphConfig config;
        config.retention = 7LL * 24 * 3600 * 1000;   // 7 days
        config.default_max_hops = 2;
        config.max_context_nodes = 50;
        config.summary_excerpt_chars = 80;
        config.summary_max_chars = 1024;
        config.mention_strength = 0.8;
        config.topic_strength = 0.7;
        config.entity_topic_strength = 0.6;
        config.co_mention_strength = 0.5;
        config.reinforce_step = 0.1;
        return config;
    }
};

/**
 * @brief Configuration for the cold (archive) tier
 */
struct ColdArchiveConfig {
    std::string data_dir;                   // archive log directory, empty keeps the chain in memory
    double delta_similarity_threshold;      // minimum copied share for a delta chunk
    uint32_t max_delta_chain;               // a raw snapshot is forced after this many deltas
    uint32_t max_persist_attempts;          // bounded retries of a failed sink write
    std::chrono::milliseconds retry_backoff;
    bool flush_on_append;                   // flush the log before append() returns

    ColdArchiveConfig() : delta_similarity_threshold(0.0), max_delta_chain(0),
                          max_persist_attempts(0), retry_backoff(0), flush_on_append(false) {}

    static ColdArchiveConfig Default() {
        ColdArchiveConfig config;
        config.data_dir = "";
        config.delta_similarity_threshold = 0.5;
        config.max_delta_chain = 16;
        config.max_persist_attempts = 3;
        config.retry_backoff = std::chrono::milliseconds(10);
        config.flush_on_append = true;
        return config;
    }
};

/**
 * @brief Configuration for PII detection and masking
 */
struct PrivacyConfig {
    std::string placeholder;
    bool detect_emails;
    bool detect_phone_numbers;
    bool detect_card_numbers;
    bool detect_national_ids;
    bool detect_ip_addresses;
    std::vector<std::string> flagged_terms;     // extra identifiers, matched case-insensitively

    PrivacyConfig() : detect_emails(false), detect_phone_numbers(false),
                      detect_card_numbers(false), detect_national_ids(false),
                      detect_ip_addresses(false) {}

    static PrivacyConfig Default() {
        PrivacyConfig config;
        config.placeholder = "[REDACTED]";
        config.detect_emails = true;
        config.detect_phone_numbers = true;
        config.detect_card_numbers = true;
        config.detect_national_ids = true;
        config.detect_ip_addresses = true;
        return config;
    }
};

/**
 * @brief How a mutation behaves when another mutation for the owner is in flight
 */
enum class SerializationMode {
    QUEUE,      // wait for the owner lock
    FAIL_FAST   // return OWNER_BUSY
};

/**
 * @brief Placement, ranking and scheduling policy of the tier controller
 */
struct TierControllerConfig {
    double warm_threshold;              // importance needed to enter warm on hot exit
    double retention_floor;             // below this, unreferenced items leaving hot are dropped
    size_t recall_limit;                // entries returned by recall_context
    size_t hot_recall_limit;            // hot items considered per recall
    size_t cold_recall_limit;           // cold items considered per deep recall
    Duration recency_window;            // recency bonus decays linearly over this window
    double recency_weight;
    double hint_bonus;                  // added to items that mention the hint
    double access_bonus_rate;           // bonus per hot access
    double access_bonus_cap;            // upper bound of the access bonus
    SerializationMode serialization_mode;
    bool enable_background_maintenance;
    std::chrono::milliseconds maintenance_interval;

    TierControllerConfig() : warm_threshold(0.0), retention_floor(0.0), recall_limit(0),
                             hot_recall_limit(0), cold_recall_limit(0), recency_window(0),
                             recency_weight(0.0), hint_bonus(0.0),
                             access_bonus_rate(0.0), access_bonus_cap(0.0),
                             serialization_mode(SerializationMode::QUEUE),
                             enable_background_maintenance(false),
                             maintenance_interval(0) {}

    static TierControllerConfig Default() {
        TierControllerConfig config;
        config.warm_threshold = 5.0;
        config.retention_floor = 2.0;
        config.recall_limit = 20;
        config.hot_recall_limit = 10;
        config.cold_recall_limit = 20;
        config.recency_window = 7LL * 24 * 3600 * 1000;    // 7-day decay
        config.recency_weight = 3.0;
        config.hint_bonus = 2.0;
        config.access_bonus_rate = 0.1;     // one point per ten accesses
        config.access_bonus_cap = 2.0;
        config.serialization_mode = SerializationMode::QUEUE;
        config.enable_background_maintenance = false;
        config.maintenance_interval = std::chrono::milliseconds(60'000);
        return config;
    }
};

/**
 * @brief Complete configuration of a memory engine
 */
struct EngineConfig {
    ImportanceConfig importance;
    HotCacheConfig hot;
    WarmGraphConfig warm;
    ColdArchiveConfig cold;
    PrivacyConfig privacy;
    TierControllerConfig controller;

    static EngineConfig Default() {
        EngineConfig config;
        config.importance = ImportanceConfig::Default();
        config.hot = HotCacheConfig::Default();
        config.warm = WarmGraphConfig::Default();
        config.cold = ColdArchiveConfig::Default();
        config.privacy = PrivacyConfig::Default();
        config.controller = TierControllerConfig::Default();
        // Items promoted out of hot and items placed in warm use one threshold
        config.hot.hot_floor = config.controller.warm_threshold;
        return config;
    }

    /**
     * @brief Checks ranges and cross-field consistency
     */
    Result<void> validate() const;
};

} // namespace core
} // namespace tiermem
