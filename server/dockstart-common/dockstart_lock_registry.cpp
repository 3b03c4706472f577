#include "dockstart_lock_registry.h"

#include <utility>

namespace dockstart
{

IdentityLockRegistry::IdentityLock::IdentityLock(IdentityLockRegistry* registry,
                                                 std::string identity,
                                                 std::shared_ptr<Entry> entry)
    : registry_(registry), identity_(std::move(identity)), entry_(std::move(entry))
{
}

IdentityLockRegistry::IdentityLock::IdentityLock(IdentityLock&& other) noexcept
    : registry_(other.registry_), identity_(std::move(other.identity_)),
      entry_(std::move(other.entry_))
{
    other.registry_ = nullptr;
}

IdentityLockRegistry::IdentityLock::~IdentityLock()
{
    if (registry_ && entry_)
    {
        entry_->mutex.unlock();
        registry_->Release(identity_, entry_);
    }
}

IdentityLockRegistry::IdentityLock IdentityLockRegistry::Acquire(const std::string& identity)
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto& slot = entries_[identity];
        if (!slot)
            slot = std::make_shared<Entry>();
        ++slot->users;
        entry = slot;
    }

    // Waiting happens outside the registry mutex.
    entry->mutex.lock();
    return IdentityLock(this, identity, std::move(entry));
}

void IdentityLockRegistry::Release(const std::string& identity,
                                   const std::shared_ptr<Entry>& entry)
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (--entry->users > 0)
        return;

    const auto it = entries_.find(identity);
    if (it != entries_.end() && it->second == entry)
        entries_.erase(it);
}

std::size_t IdentityLockRegistry::Size() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

} // namespace dockstart
