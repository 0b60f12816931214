#include "modlint/utils/json_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace modlint::json_utils
{
    TEST(JsonUtilsTest, ParseValid) {
        auto parsed = parse(R"({"a": 1, "b": [true, null]})");
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value()["a"], 1);
        EXPECT_TRUE(parsed.value()["b"].is_array());
    }

    TEST(JsonUtilsTest, ParseInvalid) {
        auto parsed = parse("{\"a\": ");
        ASSERT_TRUE(parsed.is_err());
        EXPECT_EQ(parsed.error().code(), ErrorCode::ParseError);
        EXPECT_TRUE(parsed.error().has_context());
    }

    TEST(JsonUtilsTest, TypedGet) {
        const json obj = {{"fix", true}, {"k", "four"}};

        EXPECT_EQ(get<bool>(obj, "fix").value(), true);

        auto missing = get<bool>(obj, "nope");
        ASSERT_TRUE(missing.is_err());
        EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);

        auto mismatch = get<int>(obj, "k");
        ASSERT_TRUE(mismatch.is_err());
        EXPECT_EQ(mismatch.error().code(), ErrorCode::ParseError);
    }

    TEST(JsonUtilsTest, ToStringCompactAndIndented) {
        const json obj = {{"a", 1}};
        EXPECT_EQ(to_string(obj), R"({"a":1})");
        EXPECT_EQ(to_string(obj, 2), "{\n  \"a\": 1\n}");
    }

    TEST(JsonUtilsTest, ReadFile) {
        const auto path = std::filesystem::temp_directory_path() /
                          ("modlint_json_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json");
        {
            std::ofstream out(path);
            out << R"({"x": [1, 2]})";
        }

        auto read = read_file(path);
        std::filesystem::remove(path);
        ASSERT_TRUE(read.is_ok());
        EXPECT_EQ(read.value()["x"].size(), 2u);

        auto missing = read_file(path);
        ASSERT_TRUE(missing.is_err());
        EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
    }
}
