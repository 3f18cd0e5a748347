#ifndef RHA_RESULT_HPP
#define RHA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Value-or-Error return type used by every fallible operation.
 *
 * @code
 *     auto branch = extractor.resolve_default_branch();
 *     if (branch.is_err()) {
 *         return Result<ProjectReport>::failure(branch.error());
 *     }
 *     use(branch.value());
 * @endcode
 */

#include "rha/error.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace rha {

    /**
     * Holds either a value of type T or an Error. Never empty.
     *
     * Reading the alternative that is not held throws std::logic_error;
     * callers check is_ok()/is_err() first.
     */
    template<typename T>
    class Result {
    public:
        using value_type = T;

        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(Error error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        T& value() & {
            require_value();
            return std::get<0>(data_);
        }

        const T& value() const& {
            require_value();
            return std::get<0>(data_);
        }

        T&& value() && {
            require_value();
            return std::get<0>(std::move(data_));
        }

        const Error& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on a success result");
            }
            return std::get<1>(data_);
        }

    private:
        template<std::size_t I, typename U>
        Result(std::in_place_index_t<I> index, U&& alternative)
            : data_(index, std::forward<U>(alternative)) {}

        void require_value() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on a failure result: " + std::get<1>(data_).to_string());
            }
        }

        std::variant<T, Error> data_;
    };

    /**
     * Result of an operation that produces nothing on success.
     */
    template<>
    class Result<void> {
    public:
        using value_type = void;

        static Result success() {
            return Result(std::nullopt);
        }

        static Result failure(Error error) {
            return Result(std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        const Error& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on a success result");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<Error> error)
            : error_(std::move(error)) {}

        std::optional<Error> error_;
    };

}  // namespace rha

#endif // RHA_RESULT_HPP
