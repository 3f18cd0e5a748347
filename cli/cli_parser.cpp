#include "cli_parser.hpp"

#include "rha/utils/string_utils.hpp"
#include "rha/version.hpp"

#include <iostream>

namespace rha::cli {

    namespace {

        Result<std::string> take_value(const int argc, char** argv, int& index, const std::string& flag) {
            if (index >= argc) {
                return Result<std::string>::failure(
                    Error::invalid_argument("Missing value for " + flag));
            }
            return Result<std::string>::success(argv[index++]);
        }

        Result<std::size_t> take_count(const int argc, char** argv, int& index, const std::string& flag) {
            auto value = take_value(argc, argv, index, flag);
            if (value.is_err()) {
                return Result<std::size_t>::failure(value.error());
            }
            const auto parsed = string_utils::parse_size(value.value());
            if (!parsed) {
                return Result<std::size_t>::failure(
                    Error::invalid_argument("Expected a non-negative integer for " + flag, value.value()));
            }
            return Result<std::size_t>::success(*parsed);
        }

    }  // namespace

    Result<Options> CliParser::parse(const int argc, char** argv) {
        Options opts;
        bool have_repository = false;

        int index = 1;
        while (index < argc) {
            const std::string arg = argv[index++];

            if (arg == "--help" || arg == "-h") {
                opts.command = Command::HELP;
                return Result<Options>::success(std::move(opts));
            }
            if (arg == "--version") {
                opts.command = Command::VERSION;
                return Result<Options>::success(std::move(opts));
            }

            if (arg == "--config" || arg == "-c") {
                auto value = take_value(argc, argv, index, arg);
                if (value.is_err()) return Result<Options>::failure(value.error());
                opts.config_file = std::move(value.value());
            } else if (arg == "--workers" || arg == "-j") {
                auto value = take_count(argc, argv, index, arg);
                if (value.is_err()) return Result<Options>::failure(value.error());
                if (value.value() == 0) {
                    return Result<Options>::failure(Error::invalid_argument("--workers must be at least 1"));
                }
                opts.workers = static_cast<unsigned int>(value.value());
            } else if (arg == "--since") {
                auto value = take_value(argc, argv, index, arg);
                if (value.is_err()) return Result<Options>::failure(value.error());
                opts.since = std::move(value.value());
            } else if (arg == "--max-file-size") {
                auto value = take_count(argc, argv, index, arg);
                if (value.is_err()) return Result<Options>::failure(value.error());
                opts.max_file_size_kb = value.value();
            } else if (arg == "--top") {
                auto value = take_count(argc, argv, index, arg);
                if (value.is_err()) return Result<Options>::failure(value.error());
                opts.top_n = value.value();
            } else if (arg == "--all-branches") {
                opts.all_branches = true;
            } else if (arg == "--no-extension-filter") {
                opts.no_extension_filter = true;
            } else if (arg == "--no-color") {
                opts.no_color = true;
            } else if (arg == "--verbose" || arg == "-v") {
                opts.verbose = true;
            } else if (arg == "--quiet" || arg == "-q") {
                opts.quiet = true;
            } else if (!arg.empty() && arg[0] == '-') {
                return Result<Options>::failure(Error::invalid_argument("Unknown option: " + arg));
            } else if (have_repository) {
                return Result<Options>::failure(Error::invalid_argument("Unexpected argument: " + arg));
            } else {
                opts.repository = arg;
                have_repository = true;
            }
        }

        if (opts.verbose && opts.quiet) {
            return Result<Options>::failure(Error::invalid_argument("--verbose and --quiet are mutually exclusive"));
        }
        return Result<Options>::success(std::move(opts));
    }

    void CliParser::print_help() {
        std::cout << R"(
Repository Health Analyzer (RHA) - Git history and code quality audit

USAGE:
    rha [OPTIONS] [repository]

ARGUMENTS:
    [repository]              Path inside a git work tree (default: current directory)

OPTIONS:
    -c, --config <file>       Load settings from a TOML file
    -j, --workers <n>         Worker threads for file analysis
    --all-branches            Scan every branch instead of the default branch only
    --no-extension-filter     Analyze every tracked file regardless of extension
    --since <date>            Only consider commits after this date (git date syntax)
    --max-file-size <KiB>     Skip files larger than this (0 = no limit)
    --top <n>                 Rows shown per table (default: 10)
    --no-color                Disable colored output
    -v, --verbose             Debug logging and full diagnostics
    -q, --quiet               Only print warnings, errors and the health summary
    -h, --help                Show this help message
    --version                 Show version information

EXIT CODES:
    0    Analysis completed
    1    Analysis failed
    2    Invalid arguments or configuration
    130  Interrupted

EXAMPLES:
    rha
    rha ~/src/project --since 2024-01-01
    rha --config rha.toml --all-branches .
)";
    }

    void CliParser::print_version() {
        std::cout << PROJECT_SHORT_NAME << " " << VERSION_STRING << "\n";
    }

} // namespace rha::cli
