#ifndef MODLINT_RESULT_HPP
#define MODLINT_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result<T, E>: a success value or an error, never both, never neither.
 *
 * Every recoverable failure in modlint (unreadable file, parse failure,
 * unresolved specifier, rejected config) is reported through Result so the
 * failure path is visible in the signature. The runtime converts failures
 * into diagnostics instead of throwing across component boundaries.
 *
 * @code
 *     Result<fs::path, Error> r = resolver.resolve(dir, "./b.js");
 *     if (r.is_err()) {
 *         report(r.error().message());
 *     }
 *     auto text = r.map([](const fs::path& p) { return p.string(); });
 * @endcode
 */

#include "modlint/error.hpp"

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace modlint {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Holds either a T (success) or an E (failure).
     *
     * Accessing the wrong alternative throws std::logic_error; that is a
     * programming error, not a runtime condition.
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        /**
         * Wraps a success value.
         *
         * @param value The value to hold.
         * @return A Result for which is_ok() is true.
         */
        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        /**
         * Wraps an error.
         *
         * @param error The error to hold.
         * @return A Result for which is_err() is true.
         */
        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        /**
         * Tagged constructors used by success() and failure().
         */
        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        /**
         * True when a value is held.
         */
        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        /**
         * True when an error is held.
         */
        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        /**
         * Same as is_ok().
         */
        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * @return The held value.
         * @throws std::logic_error if an error is held.
         */
        T& value() & {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        /**
         * Const access to the held value.
         * @throws std::logic_error if an error is held.
         */
        const T& value() const& {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        /**
         * Moves the held value out of an expiring Result.
         * @throws std::logic_error if an error is held.
         */
        T&& value() && {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(std::move(data_));
        }

        /**
         * @return The held error.
         * @throws std::logic_error if a value is held.
         */
        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        /**
         * Const access to the held error.
         * @throws std::logic_error if a value is held.
         */
        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        /**
         * Moves the held error out of an expiring Result.
         * @throws std::logic_error if a value is held.
         */
        E&& error() && {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(std::move(data_));
        }

        /**
         * @return A copy of the held value, or fallback when an error is held.
         */
        T value_or(T fallback) const& {
            if (is_ok()) {
                return std::get<0>(data_);
            }
            return fallback;
        }

        /**
         * Transforms the success value; errors pass through unchanged.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        /**
         * Transforms the error; success values pass through unchanged.
         */
        template<typename F>
        auto map_error(F&& f) && -> Result<T, std::invoke_result_t<F, E&&>> {
            using E2 = std::invoke_result_t<F, E&&>;
            if (is_ok()) {
                return Result<T, E2>::success(std::get<0>(std::move(data_)));
            }
            return Result<T, E2>::failure(std::forward<F>(f)(std::get<1>(std::move(data_))));
        }

        /**
         * Chains an operation that may itself fail.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using ResultType = std::invoke_result_t<F, const T&>;
            return ResultType::failure(std::get<1>(data_));
        }

        template<typename F>
        /**
         * Rvalue overload: the held value is moved into f.
         */
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using ResultType = std::invoke_result_t<F, T&&>;
            return ResultType::failure(std::get<1>(std::move(data_)));
        }

    private:
        std::variant<T, E> data_;
    };

    /**
     * Result for operations with no success payload.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        /**
         * @return A Result with no error.
         */
        static Result success() {
            return Result(success_tag);
        }

        /**
         * @param error The error to hold.
         * @return A Result for which is_err() is true.
         */
        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        /**
         * True when no error is held.
         */
        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        /**
         * True when an error is held.
         */
        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * @return The held error.
         * @throws std::logic_error on success.
         */
        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

        /**
         * Moves the held error out.
         * @throws std::logic_error on success.
         */
        E&& error() && {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::move(*error_);
        }

    private:
        std::optional<E> error_;
    };

}  // namespace modlint

#endif // MODLINT_RESULT_HPP
