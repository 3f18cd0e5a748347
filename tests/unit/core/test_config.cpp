#include "rha/config.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace rha
{
    TEST(ConfigTest, DefaultsAreValid) {
        const AnalysisConfig config;

        EXPECT_TRUE(config.validate().is_ok());
        EXPECT_GE(config.workers, 1u);
        EXPECT_LE(config.workers, 4u);
        EXPECT_TRUE(config.default_branch_only);
        EXPECT_TRUE(config.filter.enabled);
        EXPECT_EQ(config.timeouts.command, std::chrono::seconds(300));
        EXPECT_EQ(config.timeouts.validation, std::chrono::seconds(5));
        EXPECT_FALSE(config.since.has_value());
    }

    TEST(ConfigTest, ZeroWorkersIsConfigError) {
        AnalysisConfig config;
        config.workers = 0;

        const auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigTest, LoadFromString) {
        const auto result = load_config_string(R"(
            [analysis]
            workers = 3
            scan_default_branch_only = false
            since = "2023-01-01"
            max_file_size_kb = 512

            [filter]
            enabled = true
            extensions = [".cpp", "PY", ".Hpp"]

            [timeouts]
            command_seconds = 60
            validation_seconds = 2
            shutdown_grace_seconds = 1

            [logging]
            level = "warning"
        )");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& config = result.value();
        EXPECT_EQ(config.workers, 3u);
        EXPECT_FALSE(config.default_branch_only);
        EXPECT_EQ(config.since.value(), "2023-01-01");
        EXPECT_EQ(config.max_file_size_kb, 512u);
        EXPECT_EQ(config.filter.extensions, (std::vector<std::string>{".cpp", ".py", ".hpp"}));
        EXPECT_EQ(config.timeouts.command, std::chrono::seconds(60));
        EXPECT_EQ(config.timeouts.validation, std::chrono::seconds(2));
        EXPECT_EQ(config.timeouts.shutdown_grace, std::chrono::seconds(1));
        EXPECT_EQ(config.log_level, LogLevel::Warn);
    }

    TEST(ConfigTest, UnknownKeysAreIgnored) {
        const auto result = load_config_string(R"(
            [analysis]
            workers = 2
            colour = "blue"

            [unrelated]
            x = 1
        )");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().workers, 2u);
    }

    TEST(ConfigTest, WrongTypeIsConfigError) {
        const auto result = load_config_string(R"(
            [analysis]
            workers = "four"
        )");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().context().value(), "analysis.workers");
    }

    TEST(ConfigTest, HotspotSection) {
        const auto defaults = AnalysisConfig{};
        EXPECT_EQ(defaults.hotspots.top, 20u);
        EXPECT_EQ(defaults.hotspots.commit_window, 500u);

        const auto result = load_config_string(R"(
            [hotspots]
            top = 5
            commit_window = 50
        )");
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        EXPECT_EQ(result.value().hotspots.top, 5u);
        EXPECT_EQ(result.value().hotspots.commit_window, 50u);

        const auto negative = load_config_string("[hotspots]\ncommit_window = -1\n");
        ASSERT_TRUE(negative.is_err());
        EXPECT_EQ(negative.error().context().value(), "hotspots.commit_window");
    }

    TEST(ConfigTest, ZeroWorkersInFileIsConfigError) {
        const auto result = load_config_string("[analysis]\nworkers = 0\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigTest, MalformedTomlIsConfigError) {
        const auto result = load_config_string("[analysis\nworkers = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigTest, UnknownLogLevelIsConfigError) {
        const auto result = load_config_string("[logging]\nlevel = \"chatty\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigTest, LoadFromFile) {
        const auto path = std::filesystem::temp_directory_path() / "rha_config_test.toml";
        {
            std::ofstream out(path);
            out << "[analysis]\nworkers = 2\n";
        }

        const auto result = load_config_file(path);
        std::filesystem::remove(path);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().workers, 2u);
    }

    TEST(ConfigTest, MissingFileIsConfigError) {
        const auto result = load_config_file("/nonexistent/rha.toml");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(ConfigTest, ParseLogLevel) {
        EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
        EXPECT_EQ(parse_log_level(" info "), LogLevel::Info);
        EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
        EXPECT_FALSE(parse_log_level("loud").has_value());
    }

    // ============================================================================
    // Extension filter
    // ============================================================================

    TEST(FileFilterTest, AllowedExtensionPasses) {
        const FilterConfig filter;

        EXPECT_TRUE(should_include_file("src/main.cpp", filter));
        EXPECT_TRUE(should_include_file("pkg/module.PY", filter));
        EXPECT_TRUE(should_include_file("types/index.d.ts", filter));
        EXPECT_FALSE(should_include_file("docs/readme.md", filter));
        EXPECT_FALSE(should_include_file("assets/logo.png", filter));
    }

    TEST(FileFilterTest, ExtensionlessAllowList) {
        const FilterConfig filter;

        EXPECT_TRUE(should_include_file("Makefile", filter));
        EXPECT_TRUE(should_include_file("docker/Dockerfile", filter));
        EXPECT_TRUE(should_include_file("CMakeLists", filter));
        EXPECT_FALSE(should_include_file("LICENSE", filter));
        EXPECT_FALSE(should_include_file("bin/run", filter));
    }

    TEST(FileFilterTest, DotfilesExcluded) {
        const FilterConfig filter;

        EXPECT_FALSE(should_include_file(".env", filter));
        EXPECT_FALSE(should_include_file("config/.eslintrc.js", filter));
    }

    TEST(FileFilterTest, DisabledFilterPassesEverything) {
        FilterConfig filter;
        filter.enabled = false;

        EXPECT_TRUE(should_include_file(".env", filter));
        EXPECT_TRUE(should_include_file("README.md", filter));
        EXPECT_TRUE(should_include_file("LICENSE", filter));
    }
}
