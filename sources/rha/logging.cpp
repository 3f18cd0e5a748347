#include "rha/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rha {

    spdlog::level::level_enum to_spdlog_level(const LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:  return spdlog::level::info;
            case LogLevel::Warn:  return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Off:   return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    void configure_logging(const LogLevel level) {
        auto logger = spdlog::get("rha");
        if (!logger) {
            logger = spdlog::stderr_color_mt("rha");
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        }
        logger->set_level(to_spdlog_level(level));
        spdlog::set_default_logger(logger);
    }

}  // namespace rha
