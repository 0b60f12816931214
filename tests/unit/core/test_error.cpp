#include "modlint/error.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace modlint
{
    TEST(ErrorTest, FactoriesSetCode) {
        EXPECT_EQ(Error::invalid_argument("x").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::not_found("x").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::parse_error("x").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::io_error("x").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("x").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::resolve_error("x", "./a").code(), ErrorCode::ResolveError);
        EXPECT_EQ(Error::analysis_error("x").code(), ErrorCode::AnalysisError);
        EXPECT_EQ(Error::internal_error("x").code(), ErrorCode::InternalError);
    }

    TEST(ErrorTest, MessageAndContext) {
        const Error error = Error::io_error("Failed to read file", "/src/a.js");

        EXPECT_EQ(error.message(), "Failed to read file");
        ASSERT_TRUE(error.has_context());
        EXPECT_EQ(*error.context(), "/src/a.js");
    }

    TEST(ErrorTest, NoContextByDefault) {
        const Error error = Error::config_error("bad");

        EXPECT_FALSE(error.has_context());
        EXPECT_FALSE(error.context().has_value());
    }

    TEST(ErrorTest, WithContextAppends) {
        const Error base = Error::parse_error("Unexpected token", "segment 0");
        const Error more = base.with_context("/src/App.vue");

        EXPECT_EQ(*more.context(), "segment 0; /src/App.vue");
        EXPECT_EQ(*base.context(), "segment 0");

        const Error fresh = Error::parse_error("x").with_context("ctx");
        EXPECT_EQ(*fresh.context(), "ctx");
    }

    TEST(ErrorTest, ToString) {
        EXPECT_EQ(Error::not_found("missing").to_string(), "[NotFound] missing");
        EXPECT_EQ(
            Error::resolve_error("Cannot find module './b'", "/p/a.js").to_string(),
            "[ResolveError] Cannot find module './b' (context: /p/a.js)"
        );
    }

    TEST(ErrorTest, Equality) {
        EXPECT_EQ(Error::io_error("a", "b"), Error::io_error("a", "b"));
        EXPECT_NE(Error::io_error("a", "b"), Error::io_error("a"));
        EXPECT_NE(Error::io_error("a"), Error::parse_error("a"));
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream ss;
        ss << Error::internal_error("boom") << " " << ErrorCode::ConfigError;
        EXPECT_EQ(ss.str(), "[InternalError] boom ConfigError");
    }
}
