#pragma once

#include "tiermem/core/clock.h"
#include "tiermem/core/config.h"
#include "tiermem/core/types.h"
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tiermem {
namespace memory {

/**
 * @brief Why an item left the hot tier
 */
enum class EvictionReason : uint8_t {
    CAPACITY = 0,   // displaced by a newer insert
    EXPIRED = 1,    // older than max_age
    REMOVED = 2     // taken out explicitly
};

const char* eviction_reason_name(EvictionReason reason);

/**
 * @brief An item that left the hot tier
 *
 * promote is true when the importance is at or above the hot floor; the
 * controller moves such items to the warm tier instead of dropping them.
 */
struct HotEviction {
    core::MemoryItem item;
    EvictionReason reason;
    bool promote;
};

/**
 * @brief Bounded, recency-ordered cache of the latest turns of every owner
 *
 * Each owner has its own list of at most capacity_per_owner items, newest at
 * the front. Inserting past capacity displaces the least recently inserted
 * item. Reads refresh last_referenced_at but do not reorder the list, so the
 * cache always holds the N most recent turns.
 */
class HotCache {
public:
    /**
     * @brief Construct a new Hot Cache
     * @param config Capacity, hot floor and optional age bound
     * @param clock Source of last_referenced_at timestamps
     * @throws core::InvalidArgumentError if capacity_per_owner is 0
     */
    HotCache(const core::HotCacheConfig& config, std::shared_ptr<core::Clock> clock);

    ~HotCache() = default;

    // Disable copy and move (due to mutex)
    HotCache(const HotCache&) = delete;
    HotCache& operator=(const HotCache&) = delete;
    HotCache(HotCache&&) = delete;
    HotCache& operator=(HotCache&&) = delete;

    /**
     * @brief Insert an item for its owner
     * @param item The item; its tier is set to HOT
     * @return The displaced item when the owner was at capacity
     *
     * Re-inserting an id that is already cached replaces it in place.
     */
    std::optional<HotEviction> put(core::MemoryItem item);

    /**
     * @brief The item the next put() for this owner would displace
     */
    std::optional<core::MemoryItem> victim_for_insert(const core::OwnerId& owner) const;

    /**
     * @brief Most recent items, newest first
     *
     * Every returned item gets last_referenced_at = now and one more access
     * within this call. Items rejected by admit are skipped untouched and do
     * not count toward limit. Unknown owners yield an empty vector.
     */
    std::vector<core::MemoryItem> get_recent(const core::OwnerId& owner, size_t limit,
                                             const std::function<bool(const core::MemoryItem&)>& admit = nullptr);

    /**
     * @brief Read one item without touching it
     */
    std::optional<core::MemoryItem> peek(const core::OwnerId& owner, core::ItemId id) const;

    /**
     * @brief Remove an item
     * @return The removed item, std::nullopt if it was not cached
     */
    std::optional<core::MemoryItem> remove(const core::OwnerId& owner, core::ItemId id);

    /**
     * @brief Replace the importance of a cached item
     * @return false if the item is not cached
     */
    bool update_importance(const core::OwnerId& owner, core::ItemId id,
                           const core::ImportanceSignals& signals, double importance);

    /**
     * @brief Remove every item older than max_age
     *
     * Returns no evictions when max_age is 0.
     */
    std::vector<HotEviction> evict_expired();
    std::vector<HotEviction> evict_expired(const core::OwnerId& owner);

    /**
     * @brief Copies of the owner's items older than max_age, oldest first
     *
     * Nothing is removed; the caller routes each item and then remove()s it.
     */
    std::vector<core::MemoryItem> expired_items(const core::OwnerId& owner) const;

    /**
     * @brief Remove every item of an owner
     */
    std::vector<core::MemoryItem> remove_owner(const core::OwnerId& owner);

    void clear();

    size_t size() const;
    size_t size(const core::OwnerId& owner) const;
    size_t capacity_per_owner() const { return config_.capacity_per_owner; }
    std::vector<core::OwnerId> owners() const;

    std::string stats() const;
    uint64_t hit_count() const;
    uint64_t miss_count() const;
    double hit_ratio() const;
    void reset_stats();

private:
    using ItemList = std::list<core::MemoryItem>;
    using ItemIterator = ItemList::iterator;

    struct OwnerEntries {
        ItemList items;     // front = most recently inserted
        std::unordered_map<core::ItemId, ItemIterator> index;
    };

    HotEviction make_eviction(core::MemoryItem item, EvictionReason reason) const;
    std::vector<HotEviction> evict_expired_locked(OwnerEntries& entries, core::Timestamp now);

    core::HotCacheConfig config_;
    std::shared_ptr<core::Clock> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<core::OwnerId, OwnerEntries> owners_;
    size_t total_items_ = 0;

    mutable std::atomic<uint64_t> hit_count_{0};
    mutable std::atomic<uint64_t> miss_count_{0};
};

} // namespace memory
} // namespace tiermem
