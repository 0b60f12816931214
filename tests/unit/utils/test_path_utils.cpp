#include "modlint/utils/path_utils.hpp"

#include <gtest/gtest.h>

namespace modlint::path_utils
{
    namespace fs = std::filesystem;

    TEST(NormalizeTest, ResolveDots) {
        EXPECT_EQ(normalize("a/b/../c"), fs::path("a/c"));
        EXPECT_EQ(normalize("a/./b/c"), fs::path("a/b/c"));
        EXPECT_EQ(normalize("a/b/c/../../d"), fs::path("a/d"));
        EXPECT_EQ(normalize("/p/src/../lib/x.js"), fs::path("/p/lib/x.js"));
    }

    TEST(NormalizeTest, Empty) {
        EXPECT_EQ(normalize(""), fs::path("."));
    }

    TEST(NormalizeTest, LeadingDotDot) {
        EXPECT_EQ(normalize("../a/b"), fs::path("../a/b"));
        EXPECT_EQ(normalize("/../a"), fs::path("/a"));
    }

    TEST(AbsoluteFromTest, RelativeAndAbsolute) {
        EXPECT_EQ(absolute_from("src/a.js", "/p"), fs::path("/p/src/a.js"));
        EXPECT_EQ(absolute_from("./src/../a.js", "/p"), fs::path("/p/a.js"));
        EXPECT_EQ(absolute_from("/q/b.js", "/p"), fs::path("/q/b.js"));
    }

    TEST(DirectoryDepthTest, CountsDirectories) {
        EXPECT_EQ(directory_depth("/a/b/c.js"), 2u);
        EXPECT_EQ(directory_depth("/c.js"), 0u);
        EXPECT_EQ(directory_depth("c.js"), 0u);
        EXPECT_EQ(directory_depth("src/deep/x.ts"), 2u);
    }

    TEST(ExtensionTest, IncludesDot) {
        EXPECT_EQ(extension_of("/p/App.vue"), ".vue");
        EXPECT_EQ(extension_of("/p/a.d.ts"), ".ts");
        EXPECT_EQ(extension_of("/p/Makefile"), "");
    }

    TEST(PathSpecifierTest, Forms) {
        EXPECT_TRUE(is_path_specifier("./a"));
        EXPECT_TRUE(is_path_specifier("../a"));
        EXPECT_TRUE(is_path_specifier("."));
        EXPECT_TRUE(is_path_specifier(".."));
        EXPECT_TRUE(is_path_specifier("/abs"));
        EXPECT_FALSE(is_path_specifier("react"));
        EXPECT_FALSE(is_path_specifier(".hidden"));
        EXPECT_FALSE(is_path_specifier("@scope/pkg"));
    }

    TEST(MakeRelativeTest, Basic) {
        EXPECT_EQ(make_relative("/p/src/a.js", "/p"), fs::path("src/a.js"));
        EXPECT_EQ(make_relative("/q/a.js", "/p"), fs::path("../q/a.js"));
    }
}
