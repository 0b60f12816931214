#ifndef MODLINT_SPLITTER_HPP
#define MODLINT_SPLITTER_HPP

/**
 * @file splitter.hpp
 * @brief Splitting of file text into independently parseable segments.
 *
 * A plain script file is one segment at offset 0. A composite file (Vue,
 * Svelte, Astro, HTML) carries zero or more <script> blocks; each block is a
 * segment whose offset is the byte position of its body in the file.
 */

#include "modlint/types.hpp"
#include "modlint/result.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace modlint::loader {

    /**
     * One parseable unit. text views into the file text.
     */
    struct Segment {
        std::string_view text;
        std::uint32_t offset = 0;
        SourceType source_type;
    };

    class ISourceSplitter {
    public:
        virtual ~ISourceSplitter() = default;

        /**
         * Splits file text into segments.
         *
         * @param text Whole file content.
         * @param extension File extension with leading dot.
         * @return Segments in file order, or diagnostics without a path (the
         *         caller attaches it).
         */
        [[nodiscard]] virtual Result<std::vector<Segment>, Diagnostics> split(
            std::string_view text,
            std::string_view extension
        ) const = 0;
    };

    /**
     * The whole file is one segment, typed from the extension.
     */
    class PlainSplitter final : public ISourceSplitter {
    public:
        [[nodiscard]] Result<std::vector<Segment>, Diagnostics> split(
            std::string_view text,
            std::string_view extension
        ) const override;
    };

    /**
     * Extracts <script> blocks.
     *
     * A lang attribute of "ts" or "tsx" makes the block TypeScript, "jsx" or
     * "tsx" enables JSX. An unterminated block is an error.
     */
    class CompositeSplitter final : public ISourceSplitter {
    public:
        [[nodiscard]] Result<std::vector<Segment>, Diagnostics> split(
            std::string_view text,
            std::string_view extension
        ) const override;
    };

}  // namespace modlint::loader

#endif // MODLINT_SPLITTER_HPP
