#ifndef RHA_LOGGING_HPP
#define RHA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief spdlog setup for the library and the CLI.
 *
 * Library code logs through the spdlog default logger
 * (spdlog::debug/info/warn/error). configure_logging() replaces that
 * logger with a stderr color logger named "rha"; callers that embed the
 * library may install their own default logger instead.
 */

#include "rha/config.hpp"

#include <spdlog/common.h>

namespace rha {

    /**
     * Maps the configuration level onto spdlog's.
     */
    spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    /**
     * Installs the "rha" stderr logger as the spdlog default and sets its level.
     * Safe to call more than once.
     */
    void configure_logging(LogLevel level);

}  // namespace rha

#endif // RHA_LOGGING_HPP
