#include "modlint/runtime/scheduler.hpp"
#include "modlint/utils/path_utils.hpp"

#include <algorithm>
#include <utility>

namespace modlint::runtime {

    std::vector<Batch> schedule(
        const PathSet& paths,
        const std::size_t concurrency,
        const ScheduleOptions& options
    ) {
        std::vector<Batch> batches;
        if (paths.empty()) {
            return batches;
        }

        std::vector<fs::path> ordered = paths.paths();

        if (options.ordering == Ordering::DepthFirst) {
            std::vector<std::pair<std::size_t, fs::path>> keyed;
            keyed.reserve(ordered.size());
            for (auto& p : ordered) {
                keyed.emplace_back(path_utils::directory_depth(p), std::move(p));
            }

            std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
                if (a.first != b.first) {
                    return a.first > b.first;
                }
                return a.second.native() < b.second.native();
            });

            ordered.clear();
            for (auto& [depth, p] : keyed) {
                ordered.push_back(std::move(p));
            }
        }

        const std::size_t size = batch_size(concurrency, options.batch_multiplier);
        batches.reserve((ordered.size() + size - 1) / size);

        for (std::size_t start = 0; start < ordered.size(); start += size) {
            const std::size_t end = std::min(start + size, ordered.size());
            Batch batch;
            batch.index = batches.size();
            batch.paths.assign(
                std::make_move_iterator(ordered.begin() + static_cast<std::ptrdiff_t>(start)),
                std::make_move_iterator(ordered.begin() + static_cast<std::ptrdiff_t>(end))
            );
            batches.push_back(std::move(batch));
        }

        return batches;
    }

}  // namespace modlint::runtime
