#ifndef RHA_APP_HPP
#define RHA_APP_HPP

#include "cli_parser.hpp"
#include "rha/config.hpp"
#include "rha/repository_data.hpp"
#include "rha/result.hpp"

namespace rha::cli {

    class App {
    public:
        explicit App(Options options);

        /**
         * Runs the analysis and prints the report.
         *
         * @return One of exit_codes.
         */
        int run();

    private:
        /**
         * Defaults or the --config file, with command-line overrides applied.
         */
        [[nodiscard]] Result<AnalysisConfig> build_config() const;

        void print_report(const ProjectReport& report) const;

        Options options_;
    };

} // namespace rha::cli

#endif // RHA_APP_HPP
