#include "rha/result.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace rha
{
    namespace {
        Result<std::size_t> count_lines(const std::string& text) {
            if (text.empty()) {
                return Result<std::size_t>::failure(Error::parse_error("Empty input"));
            }
            return Result<std::size_t>::success(static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')));
        }
    }

    TEST(ResultTest, HoldsValue) {
        auto result = count_lines("a\nb\n");

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_EQ(result.value(), 2u);
    }

    TEST(ResultTest, HoldsError) {
        const auto result = count_lines("");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_THROW(static_cast<void>(result.value()), std::logic_error);
    }

    TEST(ResultTest, ErrorOnSuccessThrows) {
        const auto result = count_lines("x\n");
        EXPECT_THROW(static_cast<void>(result.error()), std::logic_error);
    }

    TEST(ResultTest, MoveOutValue) {
        auto result = Result<std::vector<std::string>>::success({"main", "develop"});
        const auto branches = std::move(result).value();

        EXPECT_EQ(branches.size(), 2u);
    }

    TEST(ResultTest, ValueIsMutable) {
        auto result = Result<std::string>::success("refs/heads/main");
        result.value().erase(0, 11);

        EXPECT_EQ(result.value(), "main");
    }

    TEST(ResultTest, ErrorPropagatesAcrossTypes) {
        const auto inner = count_lines("");
        const auto outer = Result<std::string>::failure(inner.error().with_context("config.toml"));

        ASSERT_TRUE(outer.is_err());
        EXPECT_EQ(outer.error().context().value(), "config.toml");
    }

    TEST(ResultTest, VoidResult) {
        const auto ok = Result<void>::success();
        const auto failed = Result<void>::failure(Error::config_error("Worker count must be at least 1"));

        EXPECT_TRUE(ok.is_ok());
        EXPECT_THROW(static_cast<void>(ok.error()), std::logic_error);
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::ConfigError);
    }
}
