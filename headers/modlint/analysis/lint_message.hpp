#ifndef MODLINT_LINT_MESSAGE_HPP
#define MODLINT_LINT_MESSAGE_HPP

/**
 * @file lint_message.hpp
 * @brief Arena-resident rule output.
 *
 * Rules report into the arena of the file being analyzed. The strings are
 * views into that arena, so a LintMessage must be cloned (DiagnosticCloner)
 * before the file's arena goes back to the pool.
 */

#include "modlint/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace modlint::analysis {

    /**
     * Replacement proposed by a rule, segment-relative.
     */
    struct ArenaFix {
        Span span;
        std::string_view content;
    };

    struct LintMessage {
        std::size_t segment = 0;
        std::string_view code;
        std::string_view message;
        std::string_view help;
        std::optional<Span> span;       // segment-relative
        Severity severity = Severity::Error;
        std::optional<ArenaFix> fix;
    };

}  // namespace modlint::analysis

#endif // MODLINT_LINT_MESSAGE_HPP
