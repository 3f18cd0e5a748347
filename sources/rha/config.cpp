#include "rha/config.hpp"

#include "rha/utils/file_utils.hpp"
#include "rha/utils/string_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <thread>
#include <toml++/toml.h>

namespace rha {

    namespace {

        Error type_error(const std::string_view section, const std::string_view key, const char* expected) {
            return Error::config_error(
                std::string("Expected ") + expected,
                std::string(section) + "." + std::string(key)
            );
        }

        Result<void> read_bool(const toml::table& table, const std::string_view section,
                               const std::string_view key, bool& out) {
            const auto node = table[key];
            if (!node) {
                return Result<void>::success();
            }
            if (const auto value = node.value<bool>()) {
                out = *value;
                return Result<void>::success();
            }
            return Result<void>::failure(type_error(section, key, "boolean"));
        }

        Result<void> read_unsigned(const toml::table& table, const std::string_view section,
                                   const std::string_view key, std::int64_t& out) {
            const auto node = table[key];
            if (!node) {
                return Result<void>::success();
            }
            if (!node.is_integer()) {
                return Result<void>::failure(type_error(section, key, "integer"));
            }
            const auto value = node.value<std::int64_t>();
            if (!value || *value < 0) {
                return Result<void>::failure(type_error(section, key, "non-negative integer"));
            }
            out = *value;
            return Result<void>::success();
        }

        Result<void> read_string(const toml::table& table, const std::string_view section,
                                 const std::string_view key, std::optional<std::string>& out) {
            const auto node = table[key];
            if (!node) {
                return Result<void>::success();
            }
            if (const auto value = node.value<std::string>()) {
                out = *value;
                return Result<void>::success();
            }
            return Result<void>::failure(type_error(section, key, "string"));
        }

        std::string normalize_extension(const std::string_view raw) {
            std::string ext = string_utils::to_lower(string_utils::trim(raw));
            if (!ext.empty() && ext.front() != '.') {
                ext.insert(ext.begin(), '.');
            }
            return ext;
        }

        Result<void> apply_analysis(const toml::table& table, AnalysisConfig& config) {
            std::int64_t workers = config.workers;
            if (auto r = read_unsigned(table, "analysis", "workers", workers); r.is_err()) {
                return r;
            }
            config.workers = static_cast<unsigned int>(workers);

            if (auto r = read_bool(table, "analysis", "scan_default_branch_only", config.default_branch_only); r.is_err()) {
                return r;
            }
            if (auto r = read_string(table, "analysis", "since", config.since); r.is_err()) {
                return r;
            }

            std::int64_t max_kb = static_cast<std::int64_t>(config.max_file_size_kb);
            if (auto r = read_unsigned(table, "analysis", "max_file_size_kb", max_kb); r.is_err()) {
                return r;
            }
            config.max_file_size_kb = static_cast<std::size_t>(max_kb);
            return Result<void>::success();
        }

        Result<void> apply_filter(const toml::table& table, AnalysisConfig& config) {
            if (auto r = read_bool(table, "filter", "enabled", config.filter.enabled); r.is_err()) {
                return r;
            }

            const auto node = table["extensions"];
            if (!node) {
                return Result<void>::success();
            }
            const auto* array = node.as_array();
            if (array == nullptr) {
                return Result<void>::failure(type_error("filter", "extensions", "array of strings"));
            }

            std::vector<std::string> extensions;
            for (const auto& element : *array) {
                const auto value = element.value<std::string>();
                if (!value) {
                    return Result<void>::failure(type_error("filter", "extensions", "array of strings"));
                }
                if (auto ext = normalize_extension(*value); !ext.empty()) {
                    extensions.push_back(std::move(ext));
                }
            }
            config.filter.extensions = std::move(extensions);
            return Result<void>::success();
        }

        Result<void> apply_timeouts(const toml::table& table, AnalysisConfig& config) {
            std::int64_t command = config.timeouts.command.count();
            std::int64_t validation = config.timeouts.validation.count();
            std::int64_t grace = config.timeouts.shutdown_grace.count();

            if (auto r = read_unsigned(table, "timeouts", "command_seconds", command); r.is_err()) {
                return r;
            }
            if (auto r = read_unsigned(table, "timeouts", "validation_seconds", validation); r.is_err()) {
                return r;
            }
            if (auto r = read_unsigned(table, "timeouts", "shutdown_grace_seconds", grace); r.is_err()) {
                return r;
            }

            config.timeouts.command = std::chrono::seconds(command);
            config.timeouts.validation = std::chrono::seconds(validation);
            config.timeouts.shutdown_grace = std::chrono::seconds(grace);
            return Result<void>::success();
        }

        Result<void> apply_hotspots(const toml::table& table, AnalysisConfig& config) {
            std::int64_t top = static_cast<std::int64_t>(config.hotspots.top);
            std::int64_t window = static_cast<std::int64_t>(config.hotspots.commit_window);

            if (auto r = read_unsigned(table, "hotspots", "top", top); r.is_err()) {
                return r;
            }
            if (auto r = read_unsigned(table, "hotspots", "commit_window", window); r.is_err()) {
                return r;
            }
            config.hotspots.top = static_cast<std::size_t>(top);
            config.hotspots.commit_window = static_cast<std::size_t>(window);
            return Result<void>::success();
        }

        Result<void> apply_logging(const toml::table& table, AnalysisConfig& config) {
            std::optional<std::string> level_name;
            if (auto r = read_string(table, "logging", "level", level_name); r.is_err()) {
                return r;
            }
            if (level_name) {
                const auto level = parse_log_level(*level_name);
                if (!level) {
                    return Result<void>::failure(
                        Error::config_error("Unknown log level '" + *level_name + "'", "logging.level"));
                }
                config.log_level = *level;
            }
            return Result<void>::success();
        }

    }  // namespace

    std::optional<LogLevel> parse_log_level(const std::string_view name) {
        const std::string lower = string_utils::to_lower(string_utils::trim(name));
        if (lower == "trace") return LogLevel::Trace;
        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info") return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warn;
        if (lower == "error") return LogLevel::Error;
        if (lower == "off") return LogLevel::Off;
        return std::nullopt;
    }

    std::vector<std::string> FilterConfig::default_extensions() {
        return {
            // C family and GPU kernels
            ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx",
            ".m", ".mm", ".swift", ".cu", ".cuh", ".cl",
            // JVM
            ".java", ".scala", ".kt",
            // Systems
            ".go", ".rs",
            // Python
            ".py", ".pyi", ".pyx", ".pxd",
            // Web
            ".js", ".mjs", ".cjs", ".jsx", ".ts", ".tsx", ".d.ts",
            // Misc
            ".lua", ".proto", ".thrift", ".asm", ".s", ".r"
        };
    }

    unsigned int AnalysisConfig::default_workers() noexcept {
        const unsigned int cores = std::thread::hardware_concurrency();
        return std::clamp(cores, 1u, 4u);
    }

    Result<void> AnalysisConfig::validate() const {
        if (workers == 0) {
            return Result<void>::failure(Error::config_error("Worker count must be at least 1", "analysis.workers"));
        }
        if (timeouts.command.count() == 0) {
            return Result<void>::failure(Error::config_error("Command timeout must be positive", "timeouts.command_seconds"));
        }
        if (timeouts.validation.count() == 0) {
            return Result<void>::failure(Error::config_error("Validation timeout must be positive", "timeouts.validation_seconds"));
        }
        return Result<void>::success();
    }

    bool should_include_file(const std::string_view path, const FilterConfig& filter) {
        if (!filter.enabled) {
            return true;
        }

        const auto name = string_utils::basename(path);
        if (name.empty() || name.front() == '.') {
            return false;
        }

        if (name.find('.') == std::string_view::npos) {
            return std::ranges::find(filter.extensionless_allow_list, name) != filter.extensionless_allow_list.end();
        }

        const std::string lower = string_utils::to_lower(name);
        return std::ranges::any_of(filter.extensions, [&lower](const std::string& ext) {
            return string_utils::ends_with(lower, ext);
        });
    }

    Result<AnalysisConfig> load_config_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<AnalysisConfig>::failure(
                Error::config_error("Configuration file not readable", path.string()));
        }
        auto config = load_config_string(content.value());
        if (config.is_err()) {
            return Result<AnalysisConfig>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<AnalysisConfig> load_config_string(const std::string_view content) {
        try {
            const toml::table tbl = toml::parse(content);
            AnalysisConfig config;

            if (const auto* analysis = tbl["analysis"].as_table()) {
                if (auto r = apply_analysis(*analysis, config); r.is_err()) {
                    return Result<AnalysisConfig>::failure(r.error());
                }
            }
            if (const auto* filter = tbl["filter"].as_table()) {
                if (auto r = apply_filter(*filter, config); r.is_err()) {
                    return Result<AnalysisConfig>::failure(r.error());
                }
            }
            if (const auto* timeouts = tbl["timeouts"].as_table()) {
                if (auto r = apply_timeouts(*timeouts, config); r.is_err()) {
                    return Result<AnalysisConfig>::failure(r.error());
                }
            }
            if (const auto* hotspots = tbl["hotspots"].as_table()) {
                if (auto r = apply_hotspots(*hotspots, config); r.is_err()) {
                    return Result<AnalysisConfig>::failure(r.error());
                }
            }
            if (const auto* logging = tbl["logging"].as_table()) {
                if (auto r = apply_logging(*logging, config); r.is_err()) {
                    return Result<AnalysisConfig>::failure(r.error());
                }
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<AnalysisConfig>::failure(validation.error());
            }

            return Result<AnalysisConfig>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<AnalysisConfig>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description())));
        }
    }

}  // namespace rha
