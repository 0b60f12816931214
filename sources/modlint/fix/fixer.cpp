#include "modlint/fix/fixer.hpp"

#include <algorithm>
#include <numeric>

namespace modlint::fix {

    FixOutcome Fixer::apply(const std::string_view source, const std::vector<Fix>& fixes) {
        FixOutcome outcome;

        std::vector<std::size_t> order(fixes.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](const std::size_t a, const std::size_t b) {
            if (fixes[a].span.start != fixes[b].span.start) {
                return fixes[a].span.start < fixes[b].span.start;
            }
            return fixes[a].span.end < fixes[b].span.end;
        });

        outcome.output.reserve(source.size());
        std::size_t cursor = 0;

        for (const std::size_t index : order) {
            const Fix& fix = fixes[index];
            if (fix.span.end < fix.span.start || fix.span.end > source.size() || fix.span.start < cursor) {
                outcome.skipped.push_back(index);
                continue;
            }

            outcome.output.append(source.substr(cursor, fix.span.start - cursor));
            outcome.output.append(fix.content);
            cursor = fix.span.end;
            outcome.applied.push_back(index);
        }

        outcome.output.append(source.substr(std::min(cursor, source.size())));
        std::sort(outcome.applied.begin(), outcome.applied.end());
        std::sort(outcome.skipped.begin(), outcome.skipped.end());
        return outcome;
    }

}  // namespace modlint::fix
