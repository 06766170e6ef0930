#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

#include "tiermem/archive/archive_sink.h"
#include "tiermem/archive/cold_archive.h"
#include "tiermem/core/clock.h"
#include "tiermem/core/config.h"
#include "tiermem/core/result.h"
#include "tiermem/core/types.h"
#include "tiermem/memory/hot_cache.h"
#include "tiermem/memory/importance_scorer.h"
#include "tiermem/memory/owner_lock_table.h"
#include "tiermem/memory/tier_metrics.h"
#include "tiermem/memory/warm_graph_store.h"
#include "tiermem/privacy/privacy_redactor.h"

namespace tiermem {
namespace memory {

/**
 * @brief How far recall_context reaches down the hierarchy
 */
enum class RecallDepth {
    SHALLOW,    // hot items and warm graph context
    DEEP        // additionally reconstructs cold items
};

/**
 * @brief Optional restrictions on recall_context
 *
 * Session and importance bounds apply to items only. Graph nodes carry
 * neither, so they are filtered by tier and by updated_at.
 */
struct RecallFilter {
    std::optional<core::SessionId> session_id;
    std::optional<core::Timestamp> since;       // inclusive
    std::optional<core::Timestamp> until;       // inclusive
    std::optional<double> min_importance;
    std::optional<double> max_importance;
    std::vector<core::Tier> tiers;              // empty admits every tier
    size_t limit = 0;                           // 0 uses the configured recall_limit

    bool includes(core::Tier tier) const;
    bool admits(const core::MemoryItem& item) const;
    bool admits(const GraphNode& node) const;
};

/**
 * @brief What happened to an item, as reported to listeners
 */
enum class MemoryEvent : uint8_t {
    STORED = 0,         // recorded into hot
    ACCESSED = 1,       // returned by recall
    TIER_CHANGED = 2    // moved to item.tier
};

const char* memory_event_name(MemoryEvent event);

using MemoryListener = std::function<void(MemoryEvent, const core::MemoryItem&)>;

/**
 * @brief One ranked result of recall_context
 */
struct RecallEntry {
    std::variant<core::MemoryItem, GraphNode> value;
    double score = 0.0;
    core::Tier source_tier = core::Tier::HOT;
    uint32_t distance = 0;      // hops from the anchor for graph nodes, 0 for items

    const core::MemoryItem* item() const { return std::get_if<core::MemoryItem>(&value); }
    const GraphNode* node() const { return std::get_if<GraphNode>(&value); }
};

/**
 * @brief One archived turn in an audit export
 */
struct AuditEntry {
    core::ChunkId chunk_id = 0;
    core::ItemId item_id = 0;
    core::SessionId session_id;
    core::Timestamp timestamp = 0;
    double importance = 0.0;
    archive::ChunkEncoding encoding = archive::ChunkEncoding::RAW;
    std::string payload;            // reconstructed, redactions applied
    std::string payload_root;
    std::optional<std::string> previous_hash;
    std::string content_hash;
    bool redacted = false;
};

/**
 * @brief Verifiable history of an owner's cold tier
 */
struct AuditExport {
    core::OwnerId owner_id;
    std::optional<std::string> head_hash;
    bool verified = false;
    std::string verification_error;     // empty when verified
    core::Timestamp exported_at = 0;
    std::vector<AuditEntry> entries;
};

/**
 * @brief What a sweep moved
 */
struct SweepReport {
    size_t hot_expired = 0;
    size_t promoted_to_warm = 0;
    size_t demoted_to_cold = 0;
    size_t dropped = 0;

    SweepReport& operator+=(const SweepReport& other);
};

/**
 * @brief Single entry and exit point of the memory hierarchy
 *
 * Owns the hot cache, warm graph and cold archive and moves items between
 * them. Every item is owned by exactly one tier at a time. Mutations of an
 * owner are serialized by the owner lock table; reads share the lock.
 *
 * Lifecycle:
 *   HOT  -> WARM   on hot exit with importance >= warm_threshold
 *   HOT  -> COLD   on hot exit with importance >= retention_floor, or
 *                  below it when the item was recalled while hot
 *   HOT  -> (drop) otherwise
 *   WARM -> COLD   when older than the warm retention window
 */
class TierController {
public:
    /**
     * @throws core::InvalidArgumentError if the configuration does not validate
     * @throws core::StorageError if the archive directory cannot be created
     */
    explicit TierController(const core::EngineConfig& config,
                            std::shared_ptr<archive::ArchiveSink> sink = nullptr,
                            std::shared_ptr<core::Clock> clock = nullptr);
    ~TierController();

    TierController(const TierController&) = delete;
    TierController& operator=(const TierController&) = delete;

    /**
     * @brief Recover the cold tier and start maintenance when configured
     *
     * Must succeed before any other operation.
     */
    core::Result<void> init();

    // ============================================================================
    // INGESTION AND RETRIEVAL
    // ============================================================================

    /**
     * @brief Score a turn and place it in the hot tier
     *
     * When the owner's hot tier is full, the displaced item is routed first.
     * If routing fails nothing is changed and the error is returned.
     */
    core::Result<core::MemoryItem> record_turn(const core::OwnerId& owner,
                                               const core::SessionId& session,
                                               const core::MemoryContent& content,
                                               const core::ImportanceSignals& signals);

    /**
     * @brief Ranked context for an owner
     *
     * Hot items first, then warm graph context, then reconstructed cold items
     * for DEEP recall. Scores add importance, a linear recency decay, a
     * per-tier bonus, a capped bonus for hot accesses and a hint bonus.
     * Returned hot items count one more access.
     */
    core::Result<std::vector<RecallEntry>> recall_context(const core::OwnerId& owner,
                                                          const std::optional<std::string>& hint,
                                                          RecallDepth depth = RecallDepth::SHALLOW,
                                                          const RecallFilter& filter = RecallFilter());

    // ============================================================================
    // INTEGRITY AND PRIVACY
    // ============================================================================

    bool verify_integrity(const core::OwnerId& owner);
    core::Result<void> check_integrity(const core::OwnerId& owner);
    core::Result<AuditExport> export_for_audit(const core::OwnerId& owner);

    core::Result<size_t> redact_pii(const core::OwnerId& owner,
                                    core::ChunkId chunk_id,
                                    const std::vector<std::string>& extra_terms = {});
    core::Result<size_t> redact_owner(const core::OwnerId& owner,
                                      const std::vector<std::string>& extra_terms = {});
    core::Result<void> redact_chunk(const core::OwnerId& owner, core::ChunkId chunk_id);

    /**
     * @brief Remove an item from whichever tier owns it
     *
     * Hot and warm copies are deleted, a cold chunk is redacted. Graph nodes
     * left without any source item are marked orphaned.
     */
    core::Result<void> forget_item(const core::OwnerId& owner, core::ItemId id);

    /**
     * @brief Forget every item of an owner
     *
     * Hot and warm items are deleted and every cold chunk is redacted. The
     * chain itself stays verifiable.
     * @return Number of items forgotten
     */
    core::Result<size_t> forget_owner(const core::OwnerId& owner);

    // ============================================================================
    // LISTENERS
    // ============================================================================

    /**
     * @brief Register a callback for item events
     *
     * Listeners run on the calling thread while the owner is locked and must
     * not call back into the controller. Exceptions they throw are logged.
     */
    void register_listener(MemoryListener listener);

    // ============================================================================
    // MAINTENANCE
    // ============================================================================

    core::Result<SweepReport> sweep(const core::OwnerId& owner);
    core::Result<SweepReport> sweep_all();

    /**
     * @brief Recompute the importance of a hot or warm item
     * @return The new importance; INVALID_ARGUMENT for cold items
     */
    core::Result<double> rescore(const core::OwnerId& owner,
                                 core::ItemId id,
                                 const core::ImportanceSignals& signals);

    std::optional<core::Tier> locate(const core::OwnerId& owner, core::ItemId id) const;

    void start_maintenance();
    void stop_maintenance();
    bool is_maintenance_running() const;

    TierMetrics::MetricsSnapshot metrics() const;
    std::string stats() const;

    const HotCache& hot_cache() const { return hot_; }
    const WarmGraphStore& warm_store() const { return warm_; }
    const archive::ColdArchive& cold_archive() const { return cold_; }
    archive::ColdArchive& cold_archive() { return cold_; }
    const core::EngineConfig& config() const { return config_; }

private:
    struct ItemRecord {
        core::Tier tier = core::Tier::HOT;
        core::ChunkId chunk_id = 0;     // set once the item is cold
    };

    core::Result<void> check_initialized() const;

    // Callers hold the owner's exclusive lock
    core::Result<std::optional<core::Tier>> route_from_hot(const core::MemoryItem& item);
    core::Result<core::ChunkId> archive_item(const core::MemoryItem& item);
    core::Result<SweepReport> sweep_locked(const core::OwnerId& owner);
    core::Result<void> forget_locked(const core::OwnerId& owner, core::ItemId id, const ItemRecord& record);
    void notify(MemoryEvent event, const core::MemoryItem& item);

    double recency(core::Timestamp at, core::Timestamp now) const;
    double score_item(const core::MemoryItem& item, const std::optional<std::string>& hint,
                      core::Timestamp now) const;
    double score_node(const ContextNode& context, const std::optional<std::string>& hint,
                      core::Timestamp now) const;
    void recall_cold(const core::OwnerId& owner, const std::optional<std::string>& hint,
                     const RecallFilter& filter, core::Timestamp now,
                     std::vector<RecallEntry>& entries);

    void set_record(const core::OwnerId& owner, core::ItemId id, ItemRecord record);
    void erase_record(const core::OwnerId& owner, core::ItemId id);
    std::optional<ItemRecord> find_record(const core::OwnerId& owner, core::ItemId id) const;

    void maintenance_loop();

    core::EngineConfig config_;
    std::shared_ptr<core::Clock> clock_;
    ImportanceScorer scorer_;
    HotCache hot_;
    WarmGraphStore warm_;
    archive::ColdArchive cold_;
    privacy::PrivacyRedactor redactor_;
    OwnerLockTable locks_;
    TierMetrics metrics_;

    std::atomic<core::ItemId> next_item_id_{1};
    std::atomic<bool> initialized_{false};

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<core::OwnerId, std::unordered_map<core::ItemId, ItemRecord>> registry_;

    std::mutex listener_mutex_;
    std::vector<MemoryListener> listeners_;

    std::atomic<bool> maintenance_running_{false};
    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
};

} // namespace memory
} // namespace tiermem
