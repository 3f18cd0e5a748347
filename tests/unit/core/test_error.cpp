#include "rha/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace rha
{
    TEST(ErrorTest, MessageWithoutContext) {
        const Error error(ErrorCode::InvalidArgument, "--workers must be at least 1");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "--workers must be at least 1");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, FactoriesSetCodes) {
        EXPECT_EQ(Error::validation_error("Not a git repository", "/tmp/x").code(), ErrorCode::ValidationError);
        EXPECT_EQ(Error::extraction_error("git log timed out").code(), ErrorCode::ExtractionError);
        EXPECT_EQ(Error::file_read_error("Failed to open file", "a.cpp").code(), ErrorCode::FileReadError);
        EXPECT_EQ(Error::parse_error("Empty commit record").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::config_error("Worker count must be at least 1").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::cancelled("Analysis cancelled").code(), ErrorCode::Cancelled);
        EXPECT_EQ(Error::io_error("Failed to fork").code(), ErrorCode::IoError);
    }

    TEST(ErrorTest, ConfigErrorNamesTheKey) {
        const auto error = Error::config_error("Expected an integer", "analysis.workers");

        ASSERT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "analysis.workers");
    }

    TEST(ErrorTest, ContextAccumulates) {
        const auto error = Error::parse_error("Malformed numstat line", "x\t1\ta.cpp");
        const auto wrapped = error.with_context("commit 3f2a9c1");

        EXPECT_EQ(wrapped.context().value(), "x\t1\ta.cpp; commit 3f2a9c1");
        EXPECT_EQ(error.context().value(), "x\t1\ta.cpp");
        EXPECT_EQ(Error::cancelled("stop").with_context("files").context().value(), "files");
    }

    TEST(ErrorTest, Formatting) {
        EXPECT_EQ(Error::parse_error("Empty commit record").to_string(), "[ParseError] Empty commit record");

        std::ostringstream oss;
        oss << Error::validation_error("Not a git repository", "/srv/repo");
        EXPECT_EQ(oss.str(), "[ValidationError] Not a git repository (context: /srv/repo)");
    }

    TEST(ErrorTest, Equality) {
        const auto a = Error::not_found("File not found", "src/a.cpp");

        EXPECT_EQ(a, Error::not_found("File not found", "src/a.cpp"));
        EXPECT_NE(a, Error::not_found("File not found", "src/b.cpp"));
        EXPECT_NE(a, Error::file_read_error("File not found", "src/a.cpp"));
    }
}
