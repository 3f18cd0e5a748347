#ifndef RHA_CLI_PARSER_HPP
#define RHA_CLI_PARSER_HPP

#include "rha/result.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rha::cli {

    enum class Command {
        ANALYZE,
        HELP,
        VERSION
    };

    /**
     * Process exit codes.
     */
    namespace exit_codes {
        inline constexpr int success = 0;
        inline constexpr int analysis_failed = 1;
        inline constexpr int usage_error = 2;
        inline constexpr int cancelled = 130;
    }

    struct Options {
        Command command = Command::ANALYZE;

        std::string repository = ".";
        std::optional<std::string> config_file;

        // Overrides applied on top of the configuration file
        std::optional<unsigned int> workers;
        std::optional<std::string> since;
        std::optional<std::size_t> max_file_size_kb;
        bool all_branches = false;
        bool no_extension_filter = false;

        std::size_t top_n = 10;
        bool verbose = false;
        bool quiet = false;
        bool no_color = false;
    };

    class CliParser {
    public:
        /**
         * @return Parsed options, or InvalidArgument for a usage error.
         */
        static Result<Options> parse(int argc, char** argv);
        static void print_help();
        static void print_version();
    };

} // namespace rha::cli

#endif // RHA_CLI_PARSER_HPP
