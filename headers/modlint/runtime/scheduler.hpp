#ifndef MODLINT_SCHEDULER_HPP
#define MODLINT_SCHEDULER_HPP

/**
 * @file scheduler.hpp
 * @brief Ordering and batching of the input paths.
 *
 * Deeply nested files tend to import fewer files than shallow ones (an
 * application root imports everything below it), so processing the deepest
 * paths first keeps the set of modules alive per batch small. The ordering
 * is a memory heuristic only; results do not depend on it.
 */

#include "modlint/runtime/path_set.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace modlint::runtime {

    /**
     * Default batch multiplier: batch size = 4 x concurrency.
     */
    inline constexpr std::size_t DEFAULT_BATCH_MULTIPLIER = 4;

    enum class Ordering {
        DepthFirst,   // deepest directory first, ties lexical
        Insertion     // caller order
    };

    struct ScheduleOptions {
        std::size_t batch_multiplier = DEFAULT_BATCH_MULTIPLIER;
        Ordering ordering = Ordering::DepthFirst;
    };

    struct Batch {
        std::size_t index = 0;
        std::vector<fs::path> paths;
    };

    /**
     * Orders paths per options and slices them into batches of
     * batch_multiplier x concurrency paths.
     *
     * An empty set gives no batches. A zero concurrency or multiplier is
     * treated as 1.
     */
    [[nodiscard]] std::vector<Batch> schedule(
        const PathSet& paths,
        std::size_t concurrency,
        const ScheduleOptions& options = {}
    );

    [[nodiscard]] inline std::size_t batch_size(std::size_t concurrency, std::size_t multiplier) noexcept {
        if (concurrency == 0) concurrency = 1;
        if (multiplier == 0) multiplier = 1;
        return concurrency * multiplier;
    }

}  // namespace modlint::runtime

#endif // MODLINT_SCHEDULER_HPP
