/**
 * @file tier_controller.cpp
 * @brief Placement, movement and retrieval of memory items across tiers
 *
 * Key Features:
 * - Atomic ingestion: the hot overflow victim is routed before the new item
 *   is inserted, under the owner's exclusive lock
 * - Threshold routing out of hot: warm, cold or dropped; recalled items
 *   are never dropped
 * - Retention-driven demotion of warm items to cold
 * - Merged, ranked and filtered recall over all tiers
 * - Item event listeners
 * - Background sweep thread
 */

#include "tiermem/memory/tier_controller.h"
#include "tiermem/archive/archive_log.h"
#include "tiermem/common/logger.h"
#include "tiermem/memory/turn_codec.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace tiermem {
namespace memory {

namespace {

const core::EngineConfig& validated(const core::EngineConfig& config) {
    auto result = config.validate();
    if (!result.ok()) {
        throw core::InvalidArgumentError(result.error());
    }
    return config;
}

core::HotCacheConfig hot_config(const core::EngineConfig& config) {
    core::HotCacheConfig hot = config.hot;
    hot.hot_floor = config.controller.warm_threshold;
    return hot;
}

std::shared_ptr<archive::ArchiveSink> make_sink(std::shared_ptr<archive::ArchiveSink> sink,
                                                const core::ColdArchiveConfig& config) {
    if (sink) {
        return sink;
    }
    if (!config.data_dir.empty()) {
        return std::make_shared<archive::ArchiveLog>(config.data_dir, config.flush_on_append);
    }
    return std::make_shared<archive::NullArchiveSink>();
}

core::Timestamp entry_time(const RecallEntry& entry) {
    if (const auto* item = entry.item()) {
        return item->created_at;
    }
    return entry.node()->updated_at;
}

} // namespace

const char* memory_event_name(MemoryEvent event) {
    switch (event) {
        case MemoryEvent::STORED: return "stored";
        case MemoryEvent::ACCESSED: return "accessed";
        case MemoryEvent::TIER_CHANGED: return "tier_changed";
    }
    return "unknown";
}

bool RecallFilter::includes(core::Tier tier) const {
    return tiers.empty() || std::find(tiers.begin(), tiers.end(), tier) != tiers.end();
}

bool RecallFilter::admits(const core::MemoryItem& item) const {
    if (!includes(item.tier)) return false;
    if (session_id && item.session_id != *session_id) return false;
    if (since && item.created_at < *since) return false;
    if (until && item.created_at > *until) return false;
    if (min_importance && item.importance < *min_importance) return false;
    if (max_importance && item.importance > *max_importance) return false;
    return true;
}

bool RecallFilter::admits(const GraphNode& node) const {
    if (!includes(core::Tier::WARM)) return false;
    if (since && node.updated_at < *since) return false;
    if (until && node.updated_at > *until) return false;
    return true;
}

SweepReport& SweepReport::operator+=(const SweepReport& other) {
    hot_expired += other.hot_expired;
    promoted_to_warm += other.promoted_to_warm;
    demoted_to_cold += other.demoted_to_cold;
    dropped += other.dropped;
    return *this;
}

TierController::TierController(const core::EngineConfig& config,
                               std::shared_ptr<archive::ArchiveSink> sink,
                               std::shared_ptr<core::Clock> clock)
    : config_(validated(config)),
      clock_(clock ? std::move(clock) : core::default_clock()),
      scorer_(config_.importance),
      hot_(hot_config(config_), clock_),
      warm_(config_.warm, clock_),
      cold_(config_.cold, make_sink(std::move(sink), config_.cold), config_.privacy.placeholder),
      redactor_(config_.privacy),
      locks_(config_.controller.serialization_mode) {}

TierController::~TierController() {
    stop_maintenance();
}

core::Result<void> TierController::init() {
    if (initialized_.load()) {
        return core::Result<void>();
    }

    auto recovered = cold_.recover();
    if (!recovered.ok()) {
        if (recovered.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
            metrics_.recordIntegrityFailure();
        }
        TIERMEM_ERROR("Memory engine failed to start: {}", recovered.error());
        return recovered;
    }

    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        registry_.clear();
        for (const auto& owner : cold_.owners()) {
            for (const auto& chunk : cold_.chunks(owner)) {
                registry_[owner][chunk.item_id] = ItemRecord{core::Tier::COLD, chunk.chunk_id};
            }
        }
    }
    next_item_id_.store(cold_.max_item_id() + 1);
    initialized_.store(true);

    if (config_.controller.enable_background_maintenance) {
        start_maintenance();
    }
    TIERMEM_INFO("Memory engine ready ({} archived owners, next item id {})",
                 cold_.owners().size(), next_item_id_.load());
    return core::Result<void>();
}

core::Result<void> TierController::check_initialized() const {
    if (!initialized_.load()) {
        return core::Result<void>::error("memory engine is not initialized",
                                         core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

// ============================================================================
// ITEM REGISTRY
// ============================================================================

void TierController::set_record(const core::OwnerId& owner, core::ItemId id, ItemRecord record) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    registry_[owner][id] = record;
}

void TierController::erase_record(const core::OwnerId& owner, core::ItemId id) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = registry_.find(owner);
    if (it != registry_.end()) {
        it->second.erase(id);
    }
}

std::optional<TierController::ItemRecord> TierController::find_record(const core::OwnerId& owner,
                                                                      core::ItemId id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = registry_.find(owner);
    if (it == registry_.end()) {
        return std::nullopt;
    }
    auto record = it->second.find(id);
    if (record == it->second.end()) {
        return std::nullopt;
    }
    return record->second;
}

std::optional<core::Tier> TierController::locate(const core::OwnerId& owner, core::ItemId id) const {
    auto record = find_record(owner, id);
    if (!record) {
        return std::nullopt;
    }
    return record->tier;
}

// ============================================================================
// LISTENERS
// ============================================================================

void TierController::register_listener(MemoryListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

void TierController::notify(MemoryEvent event, const core::MemoryItem& item) {
    std::vector<MemoryListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        if (listeners_.empty()) {
            return;
        }
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(event, item);
        } catch (const std::exception& e) {
            TIERMEM_WARN("Listener failed on {} event for item {} of owner {}: {}",
                         memory_event_name(event), item.id, item.owner_id, e.what());
        }
    }
}

// ============================================================================
// ROUTING
// ============================================================================

core::Result<core::ChunkId> TierController::archive_item(const core::MemoryItem& item) {
    archive::AppendMeta meta;
    meta.item_id = item.id;
    meta.session_id = item.session_id;
    meta.timestamp = item.created_at;

    auto appended = cold_.append(item.owner_id, encode_turn(item.content), item.importance, meta);
    if (!appended.ok()) {
        if (appended.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
            metrics_.recordIntegrityFailure();
        }
        return core::Result<core::ChunkId>::propagate(appended);
    }
    core::ChunkId chunk_id = appended.value().chunk_id;
    set_record(item.owner_id, item.id, ItemRecord{core::Tier::COLD, chunk_id});
    return core::Result<core::ChunkId>(chunk_id);
}

core::Result<std::optional<core::Tier>> TierController::route_from_hot(const core::MemoryItem& item) {
    using RouteResult = core::Result<std::optional<core::Tier>>;
    const auto& policy = config_.controller;

    if (item.importance >= policy.warm_threshold) {
        auto absorbed = warm_.absorb(item);
        if (!absorbed.ok()) {
            return RouteResult::propagate(absorbed);
        }
        set_record(item.owner_id, item.id, ItemRecord{core::Tier::WARM, 0});
        metrics_.recordTransition(core::Tier::HOT, core::Tier::WARM);
        TIERMEM_DEBUG("Item {} of owner {} promoted hot -> warm (importance {:.2f})",
                      item.id, item.owner_id, item.importance);
        core::MemoryItem moved = item;
        moved.tier = core::Tier::WARM;
        notify(MemoryEvent::TIER_CHANGED, moved);
        return RouteResult(std::optional<core::Tier>(core::Tier::WARM));
    }

    // An item that was recalled while hot is kept even below the floor
    if (item.importance >= policy.retention_floor || item.access_count > 0) {
        auto archived = archive_item(item);
        if (!archived.ok()) {
            return RouteResult::propagate(archived);
        }
        metrics_.recordTransition(core::Tier::HOT, core::Tier::COLD);
        TIERMEM_DEBUG("Item {} of owner {} demoted hot -> cold as chunk {} ({} accesses)",
                      item.id, item.owner_id, archived.value(), item.access_count);
        core::MemoryItem moved = item;
        moved.tier = core::Tier::COLD;
        notify(MemoryEvent::TIER_CHANGED, moved);
        return RouteResult(std::optional<core::Tier>(core::Tier::COLD));
    }

    erase_record(item.owner_id, item.id);
    metrics_.recordEviction(core::Tier::HOT);
    metrics_.recordDrop();
    TIERMEM_DEBUG("Item {} of owner {} dropped from hot (importance {:.2f})",
                  item.id, item.owner_id, item.importance);
    return RouteResult(std::optional<core::Tier>());
}

// ============================================================================
// INGESTION
// ============================================================================

core::Result<core::MemoryItem> TierController::record_turn(const core::OwnerId& owner,
                                                           const core::SessionId& session,
                                                           const core::MemoryContent& content,
                                                           const core::ImportanceSignals& signals) {
    using ItemResult = core::Result<core::MemoryItem>;
    ScopedTimer timer;

    auto ready = check_initialized();
    if (!ready.ok()) {
        return ItemResult::propagate(ready);
    }
    if (owner.empty()) {
        metrics_.recordRejectedInput();
        return ItemResult::error("owner id must not be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    auto scored = scorer_.score(signals);
    if (!scored.ok()) {
        metrics_.recordRejectedInput();
        return ItemResult::propagate(scored);
    }

    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return ItemResult::propagate(lock);
    }

    auto victim = hot_.victim_for_insert(owner);
    if (victim) {
        auto routed = route_from_hot(*victim);
        if (!routed.ok()) {
            TIERMEM_WARN("Turn for owner {} rejected: routing item {} out of hot failed: {}",
                         owner, victim->id, routed.error());
            return ItemResult::propagate(routed);
        }
        hot_.remove(owner, victim->id);
    }

    core::MemoryItem item;
    item.id = next_item_id_.fetch_add(1);
    item.owner_id = owner;
    item.session_id = session;
    item.content = content;
    item.signals = signals;
    item.importance = scored.value();
    item.created_at = clock_->now();
    item.last_referenced_at = item.created_at;
    item.tier = core::Tier::HOT;

    auto displaced = hot_.put(item);
    if (displaced) {
        // Unreachable while the owner lock is held; keep the item rather than lose it
        TIERMEM_ERROR("Hot cache displaced item {} of owner {} unexpectedly", displaced->item.id, owner);
        hot_.put(displaced->item);
    }
    set_record(owner, item.id, ItemRecord{core::Tier::HOT, 0});
    metrics_.recordWrite(core::Tier::HOT);
    notify(MemoryEvent::STORED, item);
    metrics_.recordRecordLatency(timer.elapsed_ns());
    return ItemResult(std::move(item));
}

// ============================================================================
// RETRIEVAL
// ============================================================================

double TierController::recency(core::Timestamp at, core::Timestamp now) const {
    core::Duration age = std::max<core::Duration>(0, now - at);
    double fraction = static_cast<double>(age) / static_cast<double>(config_.controller.recency_window);
    return std::max(0.0, 1.0 - fraction);
}

double TierController::score_item(const core::MemoryItem& item, const std::optional<std::string>& hint,
                                  core::Timestamp now) const {
    const auto& policy = config_.controller;
    double score = item.importance
                 + policy.recency_weight * recency(item.created_at, now)
                 + core::tier_traits(item.tier).recall_bonus
                 + std::min(policy.access_bonus_cap, policy.access_bonus_rate * item.access_count);
    if (hint && item.mentions(*hint)) {
        score += config_.controller.hint_bonus;
    }
    return score;
}

double TierController::score_node(const ContextNode& context, const std::optional<std::string>& hint,
                                  core::Timestamp now) const {
    const GraphNode& node = context.node;
    double references = std::max<double>(1.0, static_cast<double>(node.source_items.size()));
    double base = std::min(config_.importance.max_importance, node.weight / references);
    double score = base / (1.0 + context.distance)
                 + config_.controller.recency_weight * recency(node.updated_at, now)
                 + core::tier_traits(core::Tier::WARM).recall_bonus;
    if (hint && core::normalize_label(node.label).find(core::normalize_label(*hint)) != std::string::npos) {
        score += config_.controller.hint_bonus;
    }
    return score;
}

void TierController::recall_cold(const core::OwnerId& owner, const std::optional<std::string>& hint,
                                 const RecallFilter& filter, core::Timestamp now,
                                 std::vector<RecallEntry>& entries) {
    auto chunks = cold_.chunks(owner);
    if (chunks.empty()) {
        metrics_.recordMiss(core::Tier::COLD);
        return;
    }
    auto payloads = cold_.reconstruct(owner, chunks.size());
    if (!payloads.ok()) {
        metrics_.recordMiss(core::Tier::COLD);
        if (payloads.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
            metrics_.recordIntegrityFailure();
        }
        TIERMEM_ERROR("Cold recall for owner {} failed: {}", owner, payloads.error());
        return;
    }

    size_t added = 0;
    for (size_t i = chunks.size(); i-- > 0 && added < config_.controller.cold_recall_limit;) {
        const auto& chunk = chunks[i];
        const std::string& payload = payloads.value()[i];
        if (payload == cold_.placeholder()) {
            continue;   // forgotten
        }
        core::MemoryItem item;
        item.id = chunk.item_id;
        item.owner_id = owner;
        item.session_id = chunk.session_id;
        item.content = decode_turn(payload);
        item.importance = chunk.importance;
        item.created_at = chunk.timestamp;
        item.last_referenced_at = now;
        item.tier = core::Tier::COLD;
        if ((hint && !item.mentions(*hint)) || !filter.admits(item)) {
            continue;
        }

        RecallEntry entry;
        entry.score = score_item(item, hint, now);
        entry.source_tier = core::Tier::COLD;
        entry.value = std::move(item);
        entries.push_back(std::move(entry));
        ++added;
    }
    if (added > 0) {
        metrics_.recordHit(core::Tier::COLD);
    } else {
        metrics_.recordMiss(core::Tier::COLD);
    }
}

core::Result<std::vector<RecallEntry>> TierController::recall_context(const core::OwnerId& owner,
                                                                      const std::optional<std::string>& hint,
                                                                      RecallDepth depth,
                                                                      const RecallFilter& filter) {
    using RecallResult = core::Result<std::vector<RecallEntry>>;
    ScopedTimer timer;

    auto ready = check_initialized();
    if (!ready.ok()) {
        return RecallResult::propagate(ready);
    }
    auto lock = locks_.lock_shared(owner);
    if (!lock.ok()) {
        return RecallResult::propagate(lock);
    }

    std::vector<RecallEntry> entries;
    core::Timestamp now = clock_->now();

    // Hot: get_recent refreshes and counts an access on what it returns
    if (filter.includes(core::Tier::HOT)) {
        auto recent = hot_.get_recent(owner, config_.controller.hot_recall_limit,
                                      [&filter](const core::MemoryItem& item) { return filter.admits(item); });
        if (recent.empty()) {
            metrics_.recordMiss(core::Tier::HOT);
        } else {
            metrics_.recordHit(core::Tier::HOT);
        }
        for (auto& item : recent) {
            RecallEntry entry;
            entry.score = score_item(item, hint, now);
            entry.source_tier = core::Tier::HOT;
            entry.value = std::move(item);
            entries.push_back(std::move(entry));
        }
    }

    std::vector<ContextNode> context;
    if (filter.includes(core::Tier::WARM)) {
        context = warm_.query_context(owner, hint, config_.warm.default_max_hops);
        if (context.empty()) {
            metrics_.recordMiss(core::Tier::WARM);
        } else {
            metrics_.recordHit(core::Tier::WARM);
        }
    }
    for (auto& node : context) {
        if (!filter.admits(node.node)) {
            continue;
        }
        RecallEntry entry;
        entry.score = score_node(node, hint, now);
        entry.source_tier = core::Tier::WARM;
        entry.distance = node.distance;
        entry.value = std::move(node.node);
        entries.push_back(std::move(entry));
    }

    if (depth == RecallDepth::DEEP && filter.includes(core::Tier::COLD)) {
        recall_cold(owner, hint, filter, now, entries);
    }

    std::stable_sort(entries.begin(), entries.end(), [](const RecallEntry& a, const RecallEntry& b) {
        if (a.score != b.score) return a.score > b.score;
        return entry_time(a) > entry_time(b);
    });
    size_t limit = filter.limit > 0 ? filter.limit : config_.controller.recall_limit;
    if (entries.size() > limit) {
        entries.resize(limit);
    }
    for (const auto& entry : entries) {
        if (const auto* item = entry.item()) {
            notify(MemoryEvent::ACCESSED, *item);
        }
    }

    metrics_.recordRecallLatency(timer.elapsed_ns());
    return RecallResult(std::move(entries));
}

// ============================================================================
// INTEGRITY AND PRIVACY
// ============================================================================

core::Result<void> TierController::check_integrity(const core::OwnerId& owner) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ready;
    }
    auto lock = locks_.lock_shared(owner);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }
    auto checked = cold_.check_chain(owner);
    if (!checked.ok()) {
        metrics_.recordIntegrityFailure();
    }
    return checked;
}

bool TierController::verify_integrity(const core::OwnerId& owner) {
    return check_integrity(owner).ok();
}

core::Result<AuditExport> TierController::export_for_audit(const core::OwnerId& owner) {
    using ExportResult = core::Result<AuditExport>;
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ExportResult::propagate(ready);
    }
    auto lock = locks_.lock_shared(owner);
    if (!lock.ok()) {
        return ExportResult::propagate(lock);
    }

    AuditExport audit;
    audit.owner_id = owner;
    audit.exported_at = clock_->now();
    audit.head_hash = cold_.head_hash(owner);

    auto checked = cold_.check_chain(owner);
    audit.verified = checked.ok();
    if (!checked.ok()) {
        metrics_.recordIntegrityFailure();
        audit.verification_error = checked.error();
    }

    auto chunks = cold_.chunks(owner);
    if (chunks.empty()) {
        return ExportResult(std::move(audit));
    }
    auto payloads = cold_.reconstruct(owner, chunks.size());
    if (!payloads.ok()) {
        return ExportResult::propagate(payloads);
    }
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        AuditEntry entry;
        entry.chunk_id = chunk.chunk_id;
        entry.item_id = chunk.item_id;
        entry.session_id = chunk.session_id;
        entry.timestamp = chunk.timestamp;
        entry.importance = chunk.importance;
        entry.encoding = chunk.encoding;
        entry.payload = payloads.value()[i];
        entry.payload_root = chunk.payload_root;
        entry.previous_hash = chunk.previous_hash;
        entry.content_hash = chunk.content_hash;
        entry.redacted = chunk.redacted;
        audit.entries.push_back(std::move(entry));
    }
    return ExportResult(std::move(audit));
}

core::Result<size_t> TierController::redact_pii(const core::OwnerId& owner,
                                                core::ChunkId chunk_id,
                                                const std::vector<std::string>& extra_terms) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<size_t>::propagate(ready);
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<size_t>::propagate(lock);
    }
    auto redacted = cold_.redact_pii(owner, chunk_id, redactor_, extra_terms);
    if (!redacted.ok()) {
        if (redacted.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
            metrics_.recordIntegrityFailure();
        }
        return redacted;
    }
    if (redacted.value() > 0) {
        metrics_.recordRedaction();
    }
    return redacted;
}

core::Result<size_t> TierController::redact_owner(const core::OwnerId& owner,
                                                  const std::vector<std::string>& extra_terms) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<size_t>::propagate(ready);
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<size_t>::propagate(lock);
    }

    size_t total = 0;
    size_t count = cold_.chunk_count(owner);
    for (core::ChunkId chunk_id = 1; chunk_id <= count; ++chunk_id) {
        auto redacted = cold_.redact_pii(owner, chunk_id, redactor_, extra_terms);
        if (!redacted.ok()) {
            if (redacted.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
                metrics_.recordIntegrityFailure();
            }
            return redacted;
        }
        if (redacted.value() > 0) {
            metrics_.recordRedaction();
        }
        total += redacted.value();
    }
    return core::Result<size_t>(total);
}

core::Result<void> TierController::redact_chunk(const core::OwnerId& owner, core::ChunkId chunk_id) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ready;
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }
    auto redacted = cold_.redact_chunk(owner, chunk_id);
    if (redacted.ok()) {
        metrics_.recordRedaction();
    } else if (redacted.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
        metrics_.recordIntegrityFailure();
    }
    return redacted;
}

core::Result<void> TierController::forget_item(const core::OwnerId& owner, core::ItemId id) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return ready;
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<void>::propagate(lock);
    }

    auto record = find_record(owner, id);
    if (!record) {
        return core::Result<void>::error("item " + std::to_string(id) + " not found for owner " + owner,
                                         core::Error::Code::NOT_FOUND);
    }
    return forget_locked(owner, id, *record);
}

core::Result<void> TierController::forget_locked(const core::OwnerId& owner, core::ItemId id,
                                                 const ItemRecord& record) {
    switch (record.tier) {
        case core::Tier::HOT:
            hot_.remove(owner, id);
            break;
        case core::Tier::WARM:
            break;  // forget_item below drops the resident copy
        case core::Tier::COLD: {
            auto redacted = cold_.redact_chunk(owner, record.chunk_id);
            if (!redacted.ok()) {
                if (redacted.error_code() == core::Error::Code::CHAIN_INTEGRITY) {
                    metrics_.recordIntegrityFailure();
                }
                return redacted;
            }
            metrics_.recordRedaction();
            break;
        }
    }
    size_t orphaned = warm_.forget_item(owner, id);
    erase_record(owner, id);
    metrics_.recordEviction(record.tier);
    TIERMEM_DEBUG("Forgot item {} of owner {} from {} ({} nodes orphaned)",
                  id, owner, core::tier_name(record.tier), orphaned);
    return core::Result<void>();
}

core::Result<size_t> TierController::forget_owner(const core::OwnerId& owner) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<size_t>::propagate(ready);
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<size_t>::propagate(lock);
    }

    // Hot items go in one step; the rest one record at a time
    size_t forgotten = 0;
    for (const auto& item : hot_.remove_owner(owner)) {
        warm_.forget_item(owner, item.id);
        erase_record(owner, item.id);
        metrics_.recordEviction(core::Tier::HOT);
        ++forgotten;
    }

    std::vector<std::pair<core::ItemId, ItemRecord>> records;
    {
        std::shared_lock<std::shared_mutex> registry_lock(registry_mutex_);
        auto it = registry_.find(owner);
        if (it != registry_.end()) {
            records.assign(it->second.begin(), it->second.end());
        }
    }
    std::sort(records.begin(), records.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& entry : records) {
        auto forgot = forget_locked(owner, entry.first, entry.second);
        if (!forgot.ok()) {
            TIERMEM_ERROR("Forgetting owner {} stopped at item {} after {} items: {}",
                          owner, entry.first, forgotten, forgot.error());
            return core::Result<size_t>::propagate(forgot);
        }
        ++forgotten;
    }

    {
        std::unique_lock<std::shared_mutex> registry_lock(registry_mutex_);
        registry_.erase(owner);
    }
    TIERMEM_INFO("Forgot {} items of owner {}", forgotten, owner);
    return core::Result<size_t>(forgotten);
}

// ============================================================================
// MAINTENANCE
// ============================================================================

core::Result<SweepReport> TierController::sweep_locked(const core::OwnerId& owner) {
    SweepReport report;
    core::Timestamp now = clock_->now();

    // Hot items past max_age are routed before they leave the cache
    for (const auto& item : hot_.expired_items(owner)) {
        auto routed = route_from_hot(item);
        if (!routed.ok()) {
            return core::Result<SweepReport>::propagate(routed);
        }
        hot_.remove(owner, item.id);
        ++report.hot_expired;
        if (!routed.value()) {
            ++report.dropped;
        } else if (*routed.value() == core::Tier::WARM) {
            ++report.promoted_to_warm;
        } else {
            ++report.demoted_to_cold;
        }
    }

    core::Timestamp cutoff = now - config_.warm.retention;
    for (const auto& item : warm_.aged_items(owner, cutoff)) {
        auto archived = archive_item(item);
        if (!archived.ok()) {
            return core::Result<SweepReport>::propagate(archived);
        }
        warm_.take_item(owner, item.id);
        metrics_.recordTransition(core::Tier::WARM, core::Tier::COLD);
        ++report.demoted_to_cold;
        TIERMEM_DEBUG("Item {} of owner {} demoted warm -> cold as chunk {}",
                      item.id, owner, archived.value());
        core::MemoryItem moved = item;
        moved.tier = core::Tier::COLD;
        notify(MemoryEvent::TIER_CHANGED, moved);
    }
    return core::Result<SweepReport>(report);
}

core::Result<SweepReport> TierController::sweep(const core::OwnerId& owner) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<SweepReport>::propagate(ready);
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<SweepReport>::propagate(lock);
    }
    return sweep_locked(owner);
}

core::Result<SweepReport> TierController::sweep_all() {
    std::set<core::OwnerId> owners;
    for (const auto& owner : hot_.owners()) owners.insert(owner);
    for (const auto& owner : warm_.owners()) owners.insert(owner);

    SweepReport total;
    for (const auto& owner : owners) {
        auto swept = sweep(owner);
        if (!swept.ok()) {
            if (swept.error_code() == core::Error::Code::OWNER_BUSY) {
                TIERMEM_DEBUG("Skipping sweep of busy owner {}", owner);
                continue;
            }
            return swept;
        }
        total += swept.value();
    }
    return core::Result<SweepReport>(total);
}

core::Result<double> TierController::rescore(const core::OwnerId& owner,
                                             core::ItemId id,
                                             const core::ImportanceSignals& signals) {
    auto ready = check_initialized();
    if (!ready.ok()) {
        return core::Result<double>::propagate(ready);
    }
    auto scored = scorer_.score(signals);
    if (!scored.ok()) {
        metrics_.recordRejectedInput();
        return scored;
    }
    auto lock = locks_.lock_exclusive(owner);
    if (!lock.ok()) {
        return core::Result<double>::propagate(lock);
    }

    auto record = find_record(owner, id);
    if (!record) {
        return core::Result<double>::error("item " + std::to_string(id) + " not found for owner " + owner,
                                           core::Error::Code::NOT_FOUND);
    }
    bool updated = false;
    switch (record->tier) {
        case core::Tier::HOT:
            updated = hot_.update_importance(owner, id, signals, scored.value());
            break;
        case core::Tier::WARM:
            updated = warm_.update_importance(owner, id, signals, scored.value());
            break;
        case core::Tier::COLD:
            return core::Result<double>::error("archived item " + std::to_string(id) + " cannot be rescored",
                                               core::Error::Code::INVALID_ARGUMENT);
    }
    if (!updated) {
        return core::Result<double>::error("item " + std::to_string(id) + " is not resident",
                                           core::Error::Code::INTERNAL);
    }
    return scored;
}

void TierController::start_maintenance() {
    if (maintenance_running_.load()) {
        return; // Already running
    }
    maintenance_running_.store(true);
    maintenance_thread_ = std::thread(&TierController::maintenance_loop, this);
}

void TierController::stop_maintenance() {
    if (!maintenance_running_.load()) {
        return; // Not running
    }
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        maintenance_running_.store(false);
    }
    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

bool TierController::is_maintenance_running() const {
    return maintenance_running_.load();
}

void TierController::maintenance_loop() {
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (maintenance_running_.load()) {
        lock.unlock();
        auto swept = sweep_all();
        if (!swept.ok()) {
            TIERMEM_WARN("Background sweep failed: {}", swept.error());
        } else if (swept.value().hot_expired + swept.value().demoted_to_cold > 0) {
            TIERMEM_DEBUG("Background sweep moved {} hot and demoted {} items",
                          swept.value().hot_expired, swept.value().demoted_to_cold);
        }
        lock.lock();
        maintenance_cv_.wait_for(lock, config_.controller.maintenance_interval,
                                 [this] { return !maintenance_running_.load(); });
    }
}

TierMetrics::MetricsSnapshot TierController::metrics() const {
    return metrics_.getSnapshot();
}

std::string TierController::stats() const {
    std::ostringstream oss;
    oss << hot_.stats() << warm_.stats() << cold_.stats() << metrics_.getFormattedMetrics();
    return oss.str();
}

} // namespace memory
} // namespace tiermem
