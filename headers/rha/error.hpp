#ifndef RHA_ERROR_HPP
#define RHA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error value carried by Result.
 *
 * An Error is a code, a message and an optional context string (a path, a
 * git command line, a "section.key" config location). Components never
 * throw across module boundaries; they return Result<T> instead.
 *
 * Which code aborts what:
 * - ValidationError, ExtractionError, ConfigError, Cancelled end the run
 * - FileReadError and NotFound skip one file
 * - ParseError skips one history record
 *
 * @code
 *     auto report = analysis::analyze_repository(path, config);
 *     if (report.is_err()) {
 *         std::cerr << report.error() << "\n";
 *         // [ValidationError] Not a git repository (context: /tmp/x)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace rha {

    enum class ErrorCode {
        InvalidArgument,  ///< Bad command-line argument
        NotFound,         ///< Path does not exist
        ValidationError,  ///< Target is not a git working tree
        ExtractionError,  ///< git query failed, exited non-zero or timed out
        FileReadError,    ///< Tracked file unreadable
        ParseError,       ///< Malformed history record or input text
        IoError,          ///< Pipe or process failure
        ConfigError,      ///< Configuration malformed or out of range
        Cancelled,        ///< Run cancelled by the caller
        InternalError     ///< Broken invariant
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ValidationError: return "ValidationError";
            case ErrorCode::ExtractionError: return "ExtractionError";
            case ErrorCode::FileReadError:   return "FileReadError";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::Cancelled:       return "Cancelled";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error description. with_context() returns a new instance.
     */
    class Error {
    public:
        using Context = std::optional<std::string>;

        Error(const ErrorCode code, std::string message, Context context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, Context context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        /// @param context The repository path that failed validation.
        static Error validation_error(std::string message, std::string context) {
            return {ErrorCode::ValidationError, std::move(message), std::move(context)};
        }

        static Error extraction_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ExtractionError, std::move(message), std::move(context)};
        }

        static Error file_read_error(std::string message, std::string path) {
            return {ErrorCode::FileReadError, std::move(message), std::move(path)};
        }

        static Error parse_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error cancelled(std::string message) {
            return {ErrorCode::Cancelled, std::move(message)};
        }

        static Error internal_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const Context& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Copy with @p additional appended to the context as "old; new".
         */
        [[nodiscard]] Error with_context(std::string additional) const {
            if (!context_) {
                return {code_, message_, std::move(additional)};
            }
            return {code_, message_, *context_ + "; " + additional};
        }

        /**
         * "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string text = "[" + std::string(error_code_to_string(code_)) + "] " + message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        Context context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace rha

#endif // RHA_ERROR_HPP
