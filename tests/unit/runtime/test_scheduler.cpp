#include "modlint/runtime/scheduler.hpp"

#include <gtest/gtest.h>

namespace modlint::runtime
{
    TEST(PathSetTest, DeduplicatesInOrder) {
        PathSet set;
        EXPECT_TRUE(set.insert("/p/b.js"));
        EXPECT_TRUE(set.insert("/p/a.js"));
        EXPECT_FALSE(set.insert("/p/b.js"));

        ASSERT_EQ(set.size(), 2u);
        EXPECT_EQ(set.paths()[0], fs::path("/p/b.js"));
        EXPECT_EQ(set.paths()[1], fs::path("/p/a.js"));
        EXPECT_TRUE(set.contains("/p/a.js"));
        EXPECT_FALSE(set.contains("/p/c.js"));
    }

    TEST(SchedulerTest, EmptyInputGivesNoBatches) {
        EXPECT_TRUE(schedule(PathSet{}, 4).empty());
    }

    TEST(SchedulerTest, BatchSize) {
        EXPECT_EQ(batch_size(4, 4), 16u);
        EXPECT_EQ(batch_size(0, 4), 4u);
        EXPECT_EQ(batch_size(3, 0), 3u);
    }

    TEST(SchedulerTest, DeepestFirstThenLexical) {
        const PathSet paths{
            "/p/z.js",
            "/p/src/b.js",
            "/p/src/deep/x.js",
            "/p/src/a.js",
            "/p/a.js",
        };

        const auto batches = schedule(paths, 1, {.batch_multiplier = 10, .ordering = Ordering::DepthFirst});
        ASSERT_EQ(batches.size(), 1u);

        const std::vector<fs::path> expected{
            "/p/src/deep/x.js",
            "/p/src/a.js",
            "/p/src/b.js",
            "/p/a.js",
            "/p/z.js",
        };
        EXPECT_EQ(batches[0].paths, expected);
    }

    TEST(SchedulerTest, InsertionOrderIsKept) {
        const PathSet paths{"/p/z.js", "/p/src/deep/x.js", "/p/a.js"};

        const auto batches = schedule(paths, 1, {.batch_multiplier = 10, .ordering = Ordering::Insertion});
        ASSERT_EQ(batches.size(), 1u);
        EXPECT_EQ(batches[0].paths, paths.paths());
    }

    TEST(SchedulerTest, SlicesIntoBatches) {
        PathSet paths;
        for (int i = 0; i < 10; ++i) {
            paths.insert("/p/f" + std::to_string(i) + ".js");
        }

        const auto batches = schedule(paths, 2, {.batch_multiplier = 2, .ordering = Ordering::Insertion});
        ASSERT_EQ(batches.size(), 3u);
        EXPECT_EQ(batches[0].paths.size(), 4u);
        EXPECT_EQ(batches[1].paths.size(), 4u);
        EXPECT_EQ(batches[2].paths.size(), 2u);

        std::size_t total = 0;
        for (std::size_t i = 0; i < batches.size(); ++i) {
            EXPECT_EQ(batches[i].index, i);
            total += batches[i].paths.size();
        }
        EXPECT_EQ(total, paths.size());
        EXPECT_EQ(batches[2].paths.back(), fs::path("/p/f9.js"));
    }

    TEST(SchedulerTest, ScheduleIsDeterministic) {
        const PathSet forward{"/p/a/b.js", "/p/c.js", "/p/a/a.js"};
        const PathSet backward{"/p/a/a.js", "/p/c.js", "/p/a/b.js"};

        const auto one = schedule(forward, 1);
        const auto two = schedule(backward, 1);
        ASSERT_EQ(one.size(), two.size());
        EXPECT_EQ(one[0].paths, two[0].paths);
    }
}
