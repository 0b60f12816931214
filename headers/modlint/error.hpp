#ifndef MODLINT_ERROR_HPP
#define MODLINT_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by every fallible modlint operation.
 *
 * An Error carries a category, a message, and optional context (usually the
 * path or specifier the failure refers to). Errors are values: they travel
 * inside Result<T, Error> and are turned into diagnostics at the point where
 * the runtime recovers from them.
 *
 * Categories:
 * - InvalidArgument: caller passed something unusable
 * - NotFound: file or resource missing
 * - ParseError: source or config text could not be parsed
 * - IoError: read or write failed
 * - ConfigError: configuration rejected
 * - ResolveError: a module specifier could not be resolved
 * - AnalysisError: a rule failed while running
 * - InternalError: broken invariant
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace modlint {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,
        InvalidArgument,
        NotFound,
        ParseError,
        IoError,
        ConfigError,
        ResolveError,
        AnalysisError,
        InternalError
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::ResolveError:    return "ResolveError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message and optional context.
     *
     * Immutable after construction; with_context() returns a new value.
     */
    class Error {
    public:
        /**
         * Creates an error without context.
         *
         * @param code Category of the failure.
         * @param message Human-readable description.
         */
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        /**
         * Creates an error with context, usually the path or input involved.
         */
        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        /**
         * A caller passed a value outside the accepted range or format.
         */
        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        /**
         * A file, module or named item does not exist.
         */
        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        /**
         * Source text or JSON could not be parsed.
         *
         * @param message What the parser rejected.
         * @param context Location, e.g. "file:line".
         */
        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        /**
         * A read or write failed at the operating system level.
         */
        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        /**
         * Configuration or command-line input was rejected.
         */
        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /**
         * An import specifier did not resolve to a file.
         *
         * @param message Reason the lookup failed.
         * @param context The specifier as written.
         */
        static Error resolve_error(std::string message, std::string context) {
            return {ErrorCode::ResolveError, std::move(message), std::move(context)};
        }

        /**
         * A rule or analysis step failed on a module.
         */
        static Error analysis_error(std::string message) {
            return {ErrorCode::AnalysisError, std::move(message)};
        }

        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        /**
         * An invariant of modlint itself was broken.
         */
        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        static Error internal_error(std::string message, std::string context) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        /**
         * @return Category of the failure.
         */
        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        /**
         * @return Description without code or context.
         */
        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        /**
         * @return Context string, if any was attached.
         */
        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        /**
         * True when context() holds a value.
         */
        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns a copy with additional context appended ("a; b").
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats as "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        /**
         * Equal when code, message and context all match.
         */
        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace modlint

#endif // MODLINT_ERROR_HPP
