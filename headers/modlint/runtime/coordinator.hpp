#ifndef MODLINT_COORDINATOR_HPP
#define MODLINT_COORDINATOR_HPP

/**
 * @file coordinator.hpp
 * @brief Single-threaded owner of the module graph.
 *
 * Every batch goes through the same states:
 *
 *   AwaitingEntries -> Draining -> ClosureComplete -> Analyzing -> Released
 *
 * AwaitingEntries: one processing task per batch path not dispatched yet.
 * Draining: results arrive over a channel; each one is inserted into the
 *   graph and every newly resolved target is dispatched into the same pool.
 *   While the channel is empty the coordinator runs queued pool tasks itself.
 * ClosureComplete: no dispatched task is outstanding; records received in
 *   the batch are linked to their targets.
 * Analyzing: every module that kept Content is analyzed in the pool. The
 *   graph is read-only until all analyses report back.
 * Released: all Content of the batch is gone; graph nodes and edges stay.
 */

#include "modlint/analysis/diagnostic_cloner.hpp"
#include "modlint/analysis/executor.hpp"
#include "modlint/graph/module_graph.hpp"
#include "modlint/runtime/module_processor.hpp"
#include "modlint/runtime/path_set.hpp"
#include "modlint/runtime/scheduler.hpp"
#include "modlint/utils/channel.hpp"
#include "modlint/utils/parallel.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace modlint::runtime {

    enum class BatchState {
        AwaitingEntries,
        Draining,
        ClosureComplete,
        Analyzing,
        Released
    };

    [[nodiscard]] const char* to_string(BatchState state) noexcept;

    using StateCallback = std::function<void(std::size_t batch_index, BatchState state)>;

    struct CoordinatorOptions {
        bool cross_module = true;

        /**
         * Drop the outgoing edges of dependency-only modules once their batch
         * is released.
         */
        bool release_dependency_edges = false;
    };

    struct CoordinatorStats {
        std::size_t batches = 0;
        std::size_t dispatched = 0;
        std::size_t processed = 0;
        std::size_t failed = 0;
        std::size_t unsupported = 0;
        std::size_t analyzed = 0;
        std::size_t rule_failures = 0;
        std::size_t fixes_applied = 0;
        std::size_t files_written = 0;
        std::size_t retained_content = 0;
        std::size_t peak_retained_content = 0;
    };

    class GraphCoordinator {
    public:
        GraphCoordinator(
            const ModuleProcessor& processor,
            const analysis::AnalysisExecutor& executor,
            parallel::ThreadPool& pool,
            graph::ModuleGraph& graph,
            analysis::DiagnosticCloner& sink,
            const PathSet& entries,
            CoordinatorOptions options = {}
        );

        GraphCoordinator(const GraphCoordinator&) = delete;
        GraphCoordinator& operator=(const GraphCoordinator&) = delete;

        void set_state_callback(StateCallback callback) {
            on_state_ = std::move(callback);
        }

        /**
         * Drives one batch from AwaitingEntries to Released. Returns only
         * when every task of the batch has finished.
         */
        void run_batch(const Batch& batch);

        [[nodiscard]] const CoordinatorStats& stats() const noexcept {
            return stats_;
        }

    private:
        using ModulePtr = std::shared_ptr<ProcessedModule>;

        void transition(std::size_t batch_index, BatchState state);
        void dispatch(const fs::path& path);
        void receive(ProcessedModule module, std::vector<fs::path>& received, std::vector<ModulePtr>& analyzable);
        void analyze(std::vector<ModulePtr> analyzable);

        const ModuleProcessor& processor_;
        const analysis::AnalysisExecutor& executor_;
        parallel::ThreadPool& pool_;
        graph::ModuleGraph& graph_;
        analysis::DiagnosticCloner& sink_;
        const PathSet& entries_;
        CoordinatorOptions options_;
        StateCallback on_state_;

        parallel::Channel<ProcessedModule> results_;
        parallel::Channel<analysis::FileAnalysis> completions_;
        std::size_t outstanding_ = 0;
        CoordinatorStats stats_;
    };

}  // namespace modlint::runtime

#endif // MODLINT_COORDINATOR_HPP
