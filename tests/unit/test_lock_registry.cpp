#include <gtest/gtest.h>

#include "dockstart_lock_registry.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace dockstart;

TEST(IdentityLockRegistryTest, EntriesAreReclaimedAfterRelease)
{
    IdentityLockRegistry registry;
    {
        const IdentityLock first = registry.Acquire("desktop_alice");
        const IdentityLock second = registry.Acquire("desktop_bob");
        EXPECT_EQ(registry.Size(), 2u);
        EXPECT_EQ(first.Identity(), "desktop_alice");
    }
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(IdentityLockRegistryTest, SerializesSameIdentity)
{
    IdentityLockRegistry registry;
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]() {
            const IdentityLock lock = registry.Acquire("desktop_alice");
            const int now = ++inside;
            int seen = maxInside.load();
            while (now > seen && !maxInside.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --inside;
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(IdentityLockRegistryTest, DistinctIdentitiesDoNotBlock)
{
    IdentityLockRegistry registry;
    const IdentityLock held = registry.Acquire("desktop_alice");

    std::atomic_bool acquired{false};
    std::thread other([&]() {
        const IdentityLock lock = registry.Acquire("desktop_bob");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(registry.Size(), 1u);
}
