#ifndef MODLINT_TYPES_HPP
#define MODLINT_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core value types shared across the runtime.
 *
 * - Span: half-open byte range into a file or segment
 * - Severity / Diagnostic: the unit of output of a run
 * - Fix: a byte-range replacement proposed by a rule
 * - SourceType: language flavor of a segment
 *
 * These types own their data on the regular heap. Arena-resident variants
 * used while a file is being analyzed live in analysis/lint_message.hpp.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modlint {

    namespace fs = std::filesystem;

    // ============================================================================
    // Spans
    // ============================================================================

    /**
     * Half-open byte range [start, end).
     */
    struct Span {
        std::uint32_t start = 0;
        std::uint32_t end = 0;

        [[nodiscard]] std::uint32_t size() const noexcept {
            return end - start;
        }

        [[nodiscard]] bool empty() const noexcept {
            return start == end;
        }

        [[nodiscard]] bool overlaps(const Span& other) const noexcept {
            return start < other.end && other.start < end;
        }

        /**
         * Returns the span moved by offset bytes.
         */
        [[nodiscard]] Span shifted(std::uint32_t offset) const noexcept {
            return {start + offset, end + offset};
        }

        bool operator==(const Span&) const = default;
    };

    // ============================================================================
    // Diagnostics
    // ============================================================================

    enum class Severity {
        Off,
        Warning,
        Error
    };

    inline const char* to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::Off:     return "off";
            case Severity::Warning: return "warning";
            case Severity::Error:   return "error";
        }
        return "unknown";
    }

    /**
     * Diagnostic codes emitted by the runtime itself, as opposed to rules.
     */
    namespace codes {
        inline constexpr std::string_view io = "io";
        inline constexpr std::string_view parse = "parse";
        inline constexpr std::string_view resolve = "resolve";
        inline constexpr std::string_view rule_failure = "rule-failure";
        inline constexpr std::string_view internal = "internal";
    }

    /**
     * A single reported problem.
     *
     * segment is set when the problem belongs to one segment of a composite
     * file; span is file-absolute when present.
     */
    struct Diagnostic {
        fs::path path;
        std::optional<std::size_t> segment;
        std::optional<Span> span;
        Severity severity = Severity::Error;
        std::string code;
        std::string message;
        std::optional<std::string> help;

        bool operator==(const Diagnostic&) const = default;
    };

    using Diagnostics = std::vector<Diagnostic>;

    /**
     * Strict weak ordering used to make reports deterministic.
     */
    [[nodiscard]] bool diagnostic_less(const Diagnostic& a, const Diagnostic& b);

    /**
     * One-line human readable form: "path:start-end: severity[code]: message".
     */
    [[nodiscard]] std::string format_diagnostic(const Diagnostic& diagnostic);

    // ============================================================================
    // Fixes
    // ============================================================================

    /**
     * Replacement of span with content. An empty content deletes the span.
     */
    struct Fix {
        Span span;
        std::string content;

        bool operator==(const Fix&) const = default;
    };

    // ============================================================================
    // Source types
    // ============================================================================

    enum class Language {
        JavaScript,
        TypeScript
    };

    /**
     * Language flavor of a segment. Script files are always modules.
     */
    struct SourceType {
        Language language = Language::JavaScript;
        bool jsx = false;

        [[nodiscard]] bool is_typescript() const noexcept {
            return language == Language::TypeScript;
        }

        bool operator==(const SourceType&) const = default;
    };

    /**
     * Infers the source type from a file extension (with leading dot).
     *
     * JavaScript files always get JSX enabled so that as many files as
     * possible parse.
     */
    [[nodiscard]] std::optional<SourceType> source_type_from_extension(std::string_view extension);

}  // namespace modlint

#endif // MODLINT_TYPES_HPP
