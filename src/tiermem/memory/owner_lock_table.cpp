#include "tiermem/memory/owner_lock_table.h"

namespace tiermem {
namespace memory {

OwnerLockTable::OwnerLockTable(core::SerializationMode mode) : mode_(mode) {}

std::shared_ptr<std::shared_mutex> OwnerLockTable::mutex_for(const core::OwnerId& owner) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& mutex = locks_[owner];
    if (!mutex) {
        mutex = std::make_shared<std::shared_mutex>();
    }
    return mutex;
}

core::Result<OwnerLockTable::ExclusiveLock> OwnerLockTable::lock_exclusive(const core::OwnerId& owner) {
    auto mutex = mutex_for(owner);
    if (mode_ == core::SerializationMode::FAIL_FAST) {
        ExclusiveLock lock(*mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            return core::Result<ExclusiveLock>::error("another operation is in flight for owner " + owner,
                                                      core::Error::Code::OWNER_BUSY);
        }
        return core::Result<ExclusiveLock>(std::move(lock));
    }
    return core::Result<ExclusiveLock>(ExclusiveLock(*mutex));
}

core::Result<OwnerLockTable::SharedLock> OwnerLockTable::lock_shared(const core::OwnerId& owner) {
    auto mutex = mutex_for(owner);
    if (mode_ == core::SerializationMode::FAIL_FAST) {
        SharedLock lock(*mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            return core::Result<SharedLock>::error("owner " + owner + " is being modified",
                                                   core::Error::Code::OWNER_BUSY);
        }
        return core::Result<SharedLock>(std::move(lock));
    }
    return core::Result<SharedLock>(SharedLock(*mutex));
}

size_t OwnerLockTable::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return locks_.size();
}

} // namespace memory
} // namespace tiermem
