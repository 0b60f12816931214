#ifndef MODLINT_PARSER_HPP
#define MODLINT_PARSER_HPP

/**
 * @file parser.hpp
 * @brief Segment parser interface and the default script parser.
 */

#include "modlint/loader/ast.hpp"
#include "modlint/loader/splitter.hpp"
#include "modlint/memory/arena.hpp"
#include "modlint/result.hpp"
#include "modlint/types.hpp"

namespace modlint::loader {

    class IParser {
    public:
        virtual ~IParser() = default;

        /**
         * Parses one segment into a tree allocated in arena.
         *
         * Diagnostics carry file-absolute spans (segment.offset applied) and
         * no path.
         */
        [[nodiscard]] virtual Result<StructuralTree*, Diagnostics> parse(
            memory::Arena& arena,
            const Segment& segment
        ) const = 0;
    };

    /**
     * Statement-level parser for JavaScript and TypeScript modules.
     *
     * Tokenizes the segment (comments, strings, template literals with
     * nested substitutions, regular expression literals, brackets), checks
     * that brackets balance, then splits the token stream into top-level
     * statements. Import and export declarations are parsed fully; other
     * statements are classified and their declared and referenced
     * identifiers collected. Statement ends follow semicolons, closing braces
     * of declarations, and line breaks where automatic semicolon insertion
     * would apply.
     *
     * Errors: unterminated string, template, comment or regular expression;
     * unbalanced or mismatched brackets; malformed import declarations.
     */
    class ScriptParser final : public IParser {
    public:
        [[nodiscard]] Result<StructuralTree*, Diagnostics> parse(
            memory::Arena& arena,
            const Segment& segment
        ) const override;
    };

}  // namespace modlint::loader

#endif // MODLINT_PARSER_HPP
