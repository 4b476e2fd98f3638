#include <gtest/gtest.h>
#include <tally/ledger/item_lock_table.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tally;
using namespace tally::ledger;
using namespace std::chrono_literals;

TEST(ItemLockTableTest, GuardReleasesOnScopeExit) {
    ItemLockTable table;
    {
        auto guard = table.lock(1, {"Tools", "Rope"});
        EXPECT_TRUE(guard.ownsLock());
        EXPECT_EQ(table.activeKeys(), 1u);
    }
    EXPECT_EQ(table.activeKeys(), 0u);
}

TEST(ItemLockTableTest, MoveTransfersOwnership) {
    ItemLockTable table;
    auto first = table.lock(1, {"Tools", "Rope"});
    ItemLockTable::Guard second = std::move(first);
    EXPECT_FALSE(first.ownsLock());
    EXPECT_TRUE(second.ownsLock());

    second.release();
    EXPECT_FALSE(second.ownsLock());
    EXPECT_EQ(table.activeKeys(), 0u);

    // Releasing twice is harmless
    second.release();
}

TEST(ItemLockTableTest, DistinctKeysDoNotBlock) {
    ItemLockTable table;
    auto rope = table.lock(1, {"Tools", "Rope"});
    auto misc = table.lock(1, {"Misc", "Rope"});
    auto otherGuild = table.lock(2, {"Tools", "Rope"});
    EXPECT_EQ(table.activeKeys(), 3u);
}

TEST(ItemLockTableTest, SameKeyIsMutuallyExclusive) {
    ItemLockTable table;
    const ItemKey key{"Tools", "Rope"};

    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::int64_t counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto guard = table.lock(7, key);
                int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                ++counter;
                --inside;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(counter, 8 * 200);
    EXPECT_EQ(table.activeKeys(), 0u);
}

TEST(ItemLockTableTest, WaiterProceedsAfterRelease) {
    ItemLockTable table;
    const ItemKey key{"Tools", "Rope"};

    auto held = table.lock(3, key);
    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto guard = table.lock(3, key);
        acquired = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());
    EXPECT_EQ(table.activeKeys(), 1u);

    held.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(table.activeKeys(), 0u);
}
