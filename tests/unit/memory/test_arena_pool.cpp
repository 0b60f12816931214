#include "modlint/memory/arena_pool.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <utility>
#include <vector>

namespace modlint::memory
{
    TEST(ArenaPoolTest, RejectsZeroCapacityAndBlockSize) {
        auto no_capacity = ArenaPool::create(0);
        ASSERT_TRUE(no_capacity.is_err());
        EXPECT_EQ(no_capacity.error().code(), ErrorCode::ConfigError);

        auto no_block = ArenaPool::create(2, 0);
        ASSERT_TRUE(no_block.is_err());
        EXPECT_EQ(no_block.error().code(), ErrorCode::ConfigError);
    }

    TEST(ArenaPoolTest, ReusesReturnedArena) {
        auto pool = ArenaPool::create(2, 1024).value();

        Arena* first = nullptr;
        {
            ArenaLease lease = pool->acquire();
            first = &lease.get();
            (void)lease->copy_string("hello");
            EXPECT_GT(lease->used_bytes(), 0u);
        }
        {
            ArenaLease lease = pool->acquire();
            EXPECT_EQ(&lease.get(), first);
            EXPECT_EQ(lease->used_bytes(), 0u);
        }

        const auto stats = pool->stats();
        EXPECT_EQ(stats.created, 1u);
        EXPECT_EQ(stats.leased, 0u);
        EXPECT_EQ(stats.idle, 1u);
    }

    TEST(ArenaPoolTest, GrowsInsteadOfBlocking) {
        auto pool = ArenaPool::create(1, 1024).value();

        std::vector<ArenaLease> held;
        for (int i = 0; i < 5; ++i) {
            held.push_back(pool->acquire());
        }

        auto stats = pool->stats();
        EXPECT_EQ(stats.created, 5u);
        EXPECT_EQ(stats.leased, 5u);
        EXPECT_EQ(stats.peak_leased, 5u);

        held.clear();
        stats = pool->stats();
        EXPECT_EQ(stats.leased, 0u);
        EXPECT_EQ(stats.idle, 5u);
        EXPECT_EQ(stats.peak_leased, 5u);
    }

    TEST(ArenaPoolTest, MovedLeaseReturnsOnce) {
        auto pool = ArenaPool::create(1, 1024).value();
        {
            ArenaLease a = pool->acquire();
            ArenaLease b = std::move(a);
            (void)b->copy_string("x");
        }
        const auto stats = pool->stats();
        EXPECT_EQ(stats.leased, 0u);
        EXPECT_EQ(stats.idle, 1u);
    }

    TEST(ArenaPoolTest, ConcurrentLeases) {
        auto pool = ArenaPool::create(4, 4096).value();

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&pool] {
                for (int i = 0; i < 200; ++i) {
                    ArenaLease lease = pool->acquire();
                    (void)lease->copy_string("export const value = 1;");
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        const auto stats = pool->stats();
        EXPECT_EQ(stats.leased, 0u);
        EXPECT_LE(stats.created, 4u);
        EXPECT_EQ(stats.idle, stats.created);
    }
}
