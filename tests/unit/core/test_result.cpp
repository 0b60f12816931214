#include "modlint/result.hpp"
#include "modlint/error.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace modlint
{
    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<int, Error>::failure(Error::not_found("item not found"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ResultTest, ValueThrowsOnError) {
        auto result = Result<int, Error>::failure(Error::invalid_argument("bad arg"));
        EXPECT_THROW((void)result.value(), std::logic_error);
    }

    TEST(ResultTest, ErrorThrowsOnSuccess) {
        auto result = Result<int, Error>::success(10);
        EXPECT_THROW((void)result.error(), std::logic_error);
    }

    TEST(ResultTest, ValueOr) {
        EXPECT_EQ((Result<int, Error>::success(1).value_or(7)), 1);
        EXPECT_EQ((Result<int, Error>::failure(Error::io_error("x")).value_or(7)), 7);
    }

    TEST(ResultTest, MoveOnlyValue) {
        auto result = Result<std::unique_ptr<int>, Error>::success(std::make_unique<int>(5));
        std::unique_ptr<int> taken = std::move(result).value();
        ASSERT_NE(taken, nullptr);
        EXPECT_EQ(*taken, 5);
    }

    TEST(ResultTest, MapTransformsValue) {
        auto result = Result<int, Error>::success(21);
        auto doubled = result.map([](const int v) { return v * 2; });

        ASSERT_TRUE(doubled.is_ok());
        EXPECT_EQ(doubled.value(), 42);
    }

    TEST(ResultTest, MapPassesErrorThrough) {
        auto result = Result<int, Error>::failure(Error::parse_error("bad"));
        auto mapped = result.map([](const int v) { return std::to_string(v); });

        ASSERT_TRUE(mapped.is_err());
        EXPECT_EQ(mapped.error().code(), ErrorCode::ParseError);
    }

    TEST(ResultTest, MapError) {
        auto result = Result<int, std::string>::failure("boom");
        auto mapped = std::move(result).map_error([](std::string&& s) {
            return Error::internal_error(std::move(s));
        });

        ASSERT_TRUE(mapped.is_err());
        EXPECT_EQ(mapped.error().message(), "boom");
    }

    TEST(ResultTest, AndThenChains) {
        const auto half = [](const int v) {
            if (v % 2 != 0) {
                return Result<int, Error>::failure(Error::invalid_argument("odd"));
            }
            return Result<int, Error>::success(v / 2);
        };

        auto ok = Result<int, Error>::success(8).and_then(half).and_then(half);
        ASSERT_TRUE(ok.is_ok());
        EXPECT_EQ(ok.value(), 2);

        auto failed = Result<int, Error>::success(6).and_then(half).and_then(half);
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().message(), "odd");
    }

    TEST(ResultVoidTest, SuccessAndFailure) {
        auto ok = Result<void, Error>::success();
        EXPECT_TRUE(ok.is_ok());
        EXPECT_THROW((void)ok.error(), std::logic_error);

        auto failed = Result<void, Error>::failure(Error::io_error("disk full"));
        EXPECT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().message(), "disk full");
    }
}
