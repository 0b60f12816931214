#ifndef MODLINT_FIXER_HPP
#define MODLINT_FIXER_HPP

/**
 * @file fixer.hpp
 * @brief Merges the fixes of one file into a single rewritten text.
 *
 * Fixes are applied in order of position. A fix that overlaps one already
 * taken, or that points outside the text, is skipped and left for the next
 * run, so the output is always well defined.
 */

#include "modlint/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace modlint::fix {

    struct FixOutcome {
        std::string output;
        std::vector<std::size_t> applied;   // indices into the input list
        std::vector<std::size_t> skipped;

        [[nodiscard]] bool changed() const noexcept {
            return !applied.empty();
        }
    };

    class Fixer {
    public:
        /**
         * @param source Whole file text.
         * @param fixes File-absolute fixes, any order.
         */
        [[nodiscard]] static FixOutcome apply(std::string_view source, const std::vector<Fix>& fixes);
    };

}  // namespace modlint::fix

#endif // MODLINT_FIXER_HPP
