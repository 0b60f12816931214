#include "modlint/fix/fixer.hpp"

#include <gtest/gtest.h>

namespace modlint::fix
{
    TEST(FixerTest, NoFixesLeavesTextUnchanged) {
        const auto outcome = Fixer::apply("const a = 1;", {});
        EXPECT_EQ(outcome.output, "const a = 1;");
        EXPECT_FALSE(outcome.changed());
    }

    TEST(FixerTest, AppliesInPositionOrder) {
        const std::string source = "a; debugger; b; debugger; c;";
        const std::vector<Fix> fixes{
            Fix{Span{16, 25}, ""},
            Fix{Span{3, 12}, ""},
        };

        const auto outcome = Fixer::apply(source, fixes);
        EXPECT_EQ(outcome.output, "a;  b;  c;");
        EXPECT_EQ(outcome.applied, (std::vector<std::size_t>{0, 1}));
        EXPECT_TRUE(outcome.skipped.empty());
    }

    TEST(FixerTest, ReplacementAndInsertion) {
        const auto outcome = Fixer::apply("var x = 1", {
            Fix{Span{0, 3}, "let"},
            Fix{Span{9, 9}, ";"},
        });
        EXPECT_EQ(outcome.output, "let x = 1;");
        EXPECT_EQ(outcome.applied.size(), 2u);
    }

    TEST(FixerTest, OverlappingFixSkipped) {
        const auto outcome = Fixer::apply("abcdef", {
            Fix{Span{1, 4}, "X"},
            Fix{Span{2, 5}, "Y"},
        });
        EXPECT_EQ(outcome.output, "aXef");
        EXPECT_EQ(outcome.applied, (std::vector<std::size_t>{0}));
        EXPECT_EQ(outcome.skipped, (std::vector<std::size_t>{1}));
    }

    TEST(FixerTest, OutOfRangeFixSkipped) {
        const auto outcome = Fixer::apply("abc", {
            Fix{Span{2, 10}, ""},
            Fix{Span{2, 1}, ""},
        });
        EXPECT_EQ(outcome.output, "abc");
        EXPECT_FALSE(outcome.changed());
        EXPECT_EQ(outcome.skipped.size(), 2u);
    }

    TEST(FixerTest, AdjacentFixesBothApply) {
        const auto outcome = Fixer::apply("aabb", {
            Fix{Span{2, 4}, "B"},
            Fix{Span{0, 2}, "A"},
        });
        EXPECT_EQ(outcome.output, "AB");
        EXPECT_EQ(outcome.applied.size(), 2u);
    }
}
