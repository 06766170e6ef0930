#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "tiermem/core/config.h"
#include "tiermem/core/result.h"
#include "tiermem/core/types.h"

namespace tiermem {
namespace memory {

/**
 * @brief One reader/writer lock per owner
 *
 * Mutations of an owner take its lock exclusively, reads take it shared. In
 * FAIL_FAST mode a lock that is not immediately available yields OWNER_BUSY
 * instead of blocking. Locks are created on first use and live as long as
 * the table.
 */
class OwnerLockTable {
public:
    using ExclusiveLock = std::unique_lock<std::shared_mutex>;
    using SharedLock = std::shared_lock<std::shared_mutex>;

    explicit OwnerLockTable(core::SerializationMode mode = core::SerializationMode::QUEUE);

    OwnerLockTable(const OwnerLockTable&) = delete;
    OwnerLockTable& operator=(const OwnerLockTable&) = delete;

    core::Result<ExclusiveLock> lock_exclusive(const core::OwnerId& owner);
    core::Result<SharedLock> lock_shared(const core::OwnerId& owner);

    core::SerializationMode mode() const { return mode_; }
    size_t size() const;

private:
    std::shared_ptr<std::shared_mutex> mutex_for(const core::OwnerId& owner);

    core::SerializationMode mode_;
    mutable std::mutex table_mutex_;
    std::unordered_map<core::OwnerId, std::shared_ptr<std::shared_mutex>> locks_;
};

} // namespace memory
} // namespace tiermem
