#include "cli_parser.hpp"
#include "app.hpp"

#include <exception>
#include <iostream>

int main(const int argc, char** argv) {
    try {
        auto parsed = rha::cli::CliParser::parse(argc, argv);
        if (parsed.is_err()) {
            std::cerr << "Error: " << parsed.error().to_string() << "\n";
            std::cerr << "Run 'rha --help' for usage.\n";
            return rha::cli::exit_codes::usage_error;
        }

        const auto& options = parsed.value();

        if (options.command == rha::cli::Command::HELP) {
            rha::cli::CliParser::print_help();
            return rha::cli::exit_codes::success;
        }

        if (options.command == rha::cli::Command::VERSION) {
            rha::cli::CliParser::print_version();
            return rha::cli::exit_codes::success;
        }

        rha::cli::App app(options);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return rha::cli::exit_codes::analysis_failed;
    }
}
