#include "modlint/utils/channel.hpp"
#include "modlint/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

namespace modlint::parallel
{
    TEST(ThreadPoolTest, SizeAndDefault) {
        const ThreadPool two(2);
        EXPECT_EQ(two.size(), 2u);

        const ThreadPool automatic;
        EXPECT_EQ(automatic.size(), hardware_concurrency());
    }

    TEST(ThreadPoolTest, PostedTasksAllRun) {
        std::atomic<int> counter{0};
        {
            ThreadPool pool(4);
            for (int i = 0; i < 100; ++i) {
                pool.post([&counter] { ++counter; });
            }
            help_until(pool, [&] { return counter.load() == 100; });
        }
        EXPECT_EQ(counter.load(), 100);
    }

    TEST(ThreadPoolTest, CallerRunsPendingTask) {
        ThreadPool pool(1);

        // occupy the only worker until the caller has run a task itself
        std::atomic<bool> release{false};
        std::atomic<bool> started{false};
        pool.post([&] {
            started = true;
            while (!release.load()) {
                std::this_thread::yield();
            }
        });
        while (!started.load()) {
            std::this_thread::yield();
        }

        std::thread::id ran_on;
        pool.post([&] { ran_on = std::this_thread::get_id(); });
        EXPECT_TRUE(pool.try_run_pending_task());
        EXPECT_EQ(ran_on, std::this_thread::get_id());
        EXPECT_FALSE(pool.try_run_pending_task());

        release = true;
    }

    TEST(ChannelTest, FifoAndEmpty) {
        Channel<int> channel;
        EXPECT_TRUE(channel.empty());
        EXPECT_FALSE(channel.try_receive().has_value());

        channel.send(1);
        channel.send(2);
        EXPECT_EQ(channel.size(), 2u);
        EXPECT_EQ(channel.try_receive(), std::optional<int>(1));
        EXPECT_EQ(channel.try_receive(), std::optional<int>(2));
        EXPECT_TRUE(channel.empty());
    }

    TEST(ChannelTest, ManyProducersOneConsumer) {
        Channel<int> channel;
        ThreadPool pool(4);
        constexpr int producers = 8;
        constexpr int per_producer = 250;

        for (int p = 0; p < producers; ++p) {
            pool.post([&channel, p] {
                for (int i = 0; i < per_producer; ++i) {
                    channel.send(p * per_producer + i);
                }
            });
        }

        std::set<int> received;
        help_until(pool, [&] {
            while (auto v = channel.try_receive()) {
                received.insert(*v);
            }
            return received.size() == static_cast<std::size_t>(producers * per_producer);
        });
        EXPECT_EQ(*received.begin(), 0);
        EXPECT_EQ(*received.rbegin(), producers * per_producer - 1);
    }

    TEST(ChannelTest, MoveOnlyMessages) {
        Channel<std::unique_ptr<int>> channel;
        channel.send(std::make_unique<int>(5));
        auto message = channel.try_receive();
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(**message, 5);
    }
}
