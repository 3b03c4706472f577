#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dockstart
{

/**
 * Per-identity mutual exclusion. Entries are created on first use and erased
 * once no caller holds or waits on them, so the registry does not grow with
 * the number of identities ever seen.
 *
 * The registry mutex only guards the map; it is never held while a caller
 * holds an identity lock.
 */
class IdentityLockRegistry
{
    struct Entry
    {
        std::mutex mutex;
        std::size_t users = 0;
    };

public:
    class IdentityLock
    {
    public:
        IdentityLock(IdentityLock&& other) noexcept;
        IdentityLock& operator=(IdentityLock&&) = delete;
        IdentityLock(const IdentityLock&) = delete;
        IdentityLock& operator=(const IdentityLock&) = delete;
        ~IdentityLock();

        const std::string& Identity() const
        {
            return identity_;
        }

    private:
        friend class IdentityLockRegistry;
        IdentityLock(IdentityLockRegistry* registry, std::string identity,
                     std::shared_ptr<Entry> entry);

        IdentityLockRegistry* registry_;
        std::string identity_;
        std::shared_ptr<Entry> entry_;
    };

    IdentityLockRegistry() = default;
    IdentityLockRegistry(const IdentityLockRegistry&) = delete;
    IdentityLockRegistry& operator=(const IdentityLockRegistry&) = delete;

    // Blocks until the identity is free.
    IdentityLock Acquire(const std::string& identity);

    // Number of identities currently held or waited on.
    std::size_t Size() const;

private:
    void Release(const std::string& identity, const std::shared_ptr<Entry>& entry);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

using IdentityLock = IdentityLockRegistry::IdentityLock;

} // namespace dockstart
