/**
 * @file hot_cache.cpp
 * @brief Per-owner recency cache for the latest conversational turns
 *
 * Implementation Details:
 * - One std::list per owner ordered by insertion, newest at the front
 * - std::unordered_map from item id to list iterator for O(1) removal
 * - A single mutex guards all owners; reads refresh timestamps and so
 *   need exclusive access as well
 * - Atomic hit/miss counters, counted per get_recent() call
 */

#include "tiermem/memory/hot_cache.h"
#include "tiermem/common/logger.h"
#include "tiermem/core/error.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tiermem {
namespace memory {

const char* eviction_reason_name(EvictionReason reason) {
    switch (reason) {
        case EvictionReason::CAPACITY: return "capacity";
        case EvictionReason::EXPIRED: return "expired";
        case EvictionReason::REMOVED: return "removed";
    }
    return "unknown";
}

HotCache::HotCache(const core::HotCacheConfig& config, std::shared_ptr<core::Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : core::default_clock()) {
    if (config_.capacity_per_owner == 0) {
        throw core::InvalidArgumentError("Hot cache capacity must be greater than 0");
    }
}

HotEviction HotCache::make_eviction(core::MemoryItem item, EvictionReason reason) const {
    bool promote = item.importance >= config_.hot_floor;
    TIERMEM_DEBUG("Hot cache evicted item {} of owner {} ({}, importance {:.2f}, promote {})",
                  item.id, item.owner_id, eviction_reason_name(reason), item.importance, promote);
    return HotEviction{std::move(item), reason, promote};
}

/**
 * @brief Inserts an item, displacing the oldest insert when the owner is full
 *
 * Unknown owners are created on first insert. The displaced item, if any, is
 * returned to the caller together with its promotion verdict.
 */
std::optional<HotEviction> HotCache::put(core::MemoryItem item) {
    std::lock_guard<std::mutex> lock(mutex_);

    item.tier = core::Tier::HOT;
    auto& entries = owners_[item.owner_id];

    auto existing = entries.index.find(item.id);
    if (existing != entries.index.end()) {
        *existing->second = std::move(item);
        return std::nullopt;
    }

    std::optional<HotEviction> eviction;
    if (entries.items.size() >= config_.capacity_per_owner) {
        core::MemoryItem victim = std::move(entries.items.back());
        entries.items.pop_back();
        entries.index.erase(victim.id);
        --total_items_;
        eviction = make_eviction(std::move(victim), EvictionReason::CAPACITY);
    }

    core::ItemId id = item.id;
    entries.items.push_front(std::move(item));
    entries.index[id] = entries.items.begin();
    ++total_items_;
    return eviction;
}

std::optional<core::MemoryItem> HotCache::victim_for_insert(const core::OwnerId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = owners_.find(owner);
    if (it == owners_.end() || it->second.items.size() < config_.capacity_per_owner) {
        return std::nullopt;
    }
    return it->second.items.back();
}

std::vector<core::MemoryItem> HotCache::get_recent(const core::OwnerId& owner, size_t limit,
                                                   const std::function<bool(const core::MemoryItem&)>& admit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<core::MemoryItem> result;
    auto it = owners_.find(owner);
    if (it == owners_.end() || it->second.items.empty() || limit == 0) {
        miss_count_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }
    hit_count_.fetch_add(1, std::memory_order_relaxed);

    core::Timestamp now = clock_->now();
    result.reserve(std::min(limit, it->second.items.size()));
    for (auto& item : it->second.items) {
        if (result.size() >= limit) {
            break;
        }
        if (admit && !admit(item)) {
            continue;
        }
        item.last_referenced_at = now;
        ++item.access_count;
        result.push_back(item);
    }
    return result;
}

std::optional<core::MemoryItem> HotCache::peek(const core::OwnerId& owner, core::ItemId id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    auto item_it = it->second.index.find(id);
    if (item_it == it->second.index.end()) {
        return std::nullopt;
    }
    return *item_it->second;
}

std::optional<core::MemoryItem> HotCache::remove(const core::OwnerId& owner, core::ItemId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    auto item_it = it->second.index.find(id);
    if (item_it == it->second.index.end()) {
        return std::nullopt;
    }
    core::MemoryItem item = std::move(*item_it->second);
    it->second.items.erase(item_it->second);
    it->second.index.erase(item_it);
    --total_items_;
    return item;
}

bool HotCache::update_importance(const core::OwnerId& owner, core::ItemId id,
                                 const core::ImportanceSignals& signals, double importance) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return false;
    }
    auto item_it = it->second.index.find(id);
    if (item_it == it->second.index.end()) {
        return false;
    }
    item_it->second->signals = signals;
    item_it->second->importance = importance;
    return true;
}

std::vector<HotEviction> HotCache::evict_expired_locked(OwnerEntries& entries, core::Timestamp now) {
    std::vector<HotEviction> evicted;
    for (auto it = entries.items.begin(); it != entries.items.end();) {
        if (now - it->created_at > config_.max_age) {
            entries.index.erase(it->id);
            evicted.push_back(make_eviction(std::move(*it), EvictionReason::EXPIRED));
            it = entries.items.erase(it);
            --total_items_;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<HotEviction> HotCache::evict_expired() {
    std::vector<HotEviction> evicted;
    if (config_.max_age <= 0) {
        return evicted;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    core::Timestamp now = clock_->now();
    for (auto& [owner, entries] : owners_) {
        auto owner_evicted = evict_expired_locked(entries, now);
        for (auto& eviction : owner_evicted) {
            evicted.push_back(std::move(eviction));
        }
    }
    return evicted;
}

std::vector<HotEviction> HotCache::evict_expired(const core::OwnerId& owner) {
    std::vector<HotEviction> evicted;
    if (config_.max_age <= 0) {
        return evicted;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return evicted;
    }
    return evict_expired_locked(it->second, clock_->now());
}

std::vector<core::MemoryItem> HotCache::expired_items(const core::OwnerId& owner) const {
    std::vector<core::MemoryItem> expired;
    if (config_.max_age <= 0) {
        return expired;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return expired;
    }
    core::Timestamp now = clock_->now();
    for (auto item = it->second.items.rbegin(); item != it->second.items.rend(); ++item) {
        if (now - item->created_at > config_.max_age) {
            expired.push_back(*item);
        }
    }
    return expired;
}

std::vector<core::MemoryItem> HotCache::remove_owner(const core::OwnerId& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<core::MemoryItem> removed;
    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return removed;
    }
    for (auto& item : it->second.items) {
        removed.push_back(std::move(item));
    }
    total_items_ -= removed.size();
    owners_.erase(it);
    return removed;
}

void HotCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    owners_.clear();
    total_items_ = 0;
}

size_t HotCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_items_;
}

size_t HotCache::size(const core::OwnerId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(owner);
    return it == owners_.end() ? 0 : it->second.items.size();
}

std::vector<core::OwnerId> HotCache::owners() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<core::OwnerId> ids;
    ids.reserve(owners_.size());
    for (const auto& [owner, entries] : owners_) {
        if (!entries.items.empty()) {
            ids.push_back(owner);
        }
    }
    return ids;
}

std::string HotCache::stats() const {
    std::ostringstream oss;
    oss << "HotCache Stats:\n";
    oss << "  Owners: " << owners().size() << "\n";
    oss << "  Items: " << size() << " (capacity " << config_.capacity_per_owner << " per owner)\n";
    oss << "  Hit count: " << hit_count() << "\n";
    oss << "  Miss count: " << miss_count() << "\n";
    oss << "  Hit ratio: " << std::fixed << std::setprecision(2) << hit_ratio() << "%\n";
    return oss.str();
}

uint64_t HotCache::hit_count() const {
    return hit_count_.load(std::memory_order_relaxed);
}

uint64_t HotCache::miss_count() const {
    return miss_count_.load(std::memory_order_relaxed);
}

double HotCache::hit_ratio() const {
    uint64_t hits = hit_count_.load(std::memory_order_relaxed);
    uint64_t misses = miss_count_.load(std::memory_order_relaxed);
    uint64_t total = hits + misses;

    if (total == 0) {
        return 0.0;
    }

    return static_cast<double>(hits) / total * 100.0;
}

void HotCache::reset_stats() {
    hit_count_.store(0, std::memory_order_relaxed);
    miss_count_.store(0, std::memory_order_relaxed);
}

} // namespace memory
} // namespace tiermem
