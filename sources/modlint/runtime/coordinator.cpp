#include "modlint/runtime/coordinator.hpp"
#include "modlint/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace modlint::runtime {

    const char* to_string(const BatchState state) noexcept {
        switch (state) {
            case BatchState::AwaitingEntries: return "awaiting-entries";
            case BatchState::Draining:        return "draining";
            case BatchState::ClosureComplete: return "closure-complete";
            case BatchState::Analyzing:       return "analyzing";
            case BatchState::Released:        return "released";
        }
        return "unknown";
    }

    namespace {

        Diagnostic internal_diagnostic(const fs::path& path, const std::string& what) {
            Diagnostic d;
            d.path = path;
            d.severity = Severity::Error;
            d.code = std::string(codes::internal);
            d.message = what;
            return d;
        }

    }  // namespace

    GraphCoordinator::GraphCoordinator(
        const ModuleProcessor& processor,
        const analysis::AnalysisExecutor& executor,
        parallel::ThreadPool& pool,
        graph::ModuleGraph& graph,
        analysis::DiagnosticCloner& sink,
        const PathSet& entries,
        const CoordinatorOptions options
    )
        : processor_(processor)
        , executor_(executor)
        , pool_(pool)
        , graph_(graph)
        , sink_(sink)
        , entries_(entries)
        , options_(options) {}

    void GraphCoordinator::transition(const std::size_t batch_index, const BatchState state) {
        log::logger()->debug("batch {}: {}", batch_index, to_string(state));
        if (on_state_) {
            on_state_(batch_index, state);
        }
    }

    void GraphCoordinator::dispatch(const fs::path& path) {
        ++outstanding_;
        ++stats_.dispatched;
        const bool is_entry = entries_.contains(path);

        pool_.post([this, path, is_entry] {
            std::string what;
            try {
                results_.send(processor_.process(path, is_entry));
                return;
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "unknown exception";
            }

            ProcessedModule failed;
            failed.path = path;
            failed.is_entry = is_entry;
            failed.records.push_back(SegmentResult::failure(
                Diagnostics{internal_diagnostic(path, "Processing failed: " + what)}
            ));
            results_.send(std::move(failed));
        });
    }

    void GraphCoordinator::receive(
        ProcessedModule module,
        std::vector<fs::path>& received,
        std::vector<ModulePtr>& analyzable
    ) {
        ++stats_.processed;
        const fs::path path = module.path;

        graph_.add_module(path);
        if (module.is_entry) {
            graph_.mark_entry(path);
        }
        if (!module.supported) {
            ++stats_.unsupported;
        }

        bool failed = false;
        for (const auto& result : module.records) {
            if (result.is_err()) {
                sink_.add_all(result.error());
                failed = true;
                continue;
            }

            const auto& resolved = result.value();
            graph_.add_record(path, resolved.record);

            for (const auto& request : resolved.requests) {
                if (request.resolved.is_err()) {
                    graph_.add_unresolved(path, request.specifier, request.resolved.error());
                    continue;
                }
                const fs::path& target = request.resolved.value();
                graph_.add_edge(path, request.specifier, target);
                if (graph_.mark_dispatched(target)) {
                    dispatch(target);
                }
            }
        }

        if (failed) {
            graph_.mark_failed(path);
            ++stats_.failed;
        }

        received.push_back(path);

        if (module.content) {
            ++stats_.retained_content;
            if (stats_.retained_content > stats_.peak_retained_content) {
                stats_.peak_retained_content = stats_.retained_content;
            }
            analyzable.push_back(std::make_shared<ProcessedModule>(std::move(module)));
        }
    }

    void GraphCoordinator::analyze(std::vector<ModulePtr> analyzable) {
        std::size_t pending = analyzable.size();
        const graph::ModuleGraph* graph = options_.cross_module ? &graph_ : nullptr;

        for (auto& module : analyzable) {
            pool_.post([this, graph, module = std::move(module)] {
                analysis::FileAnalysis outcome;
                try {
                    outcome = executor_.analyze(*module, graph);
                } catch (const std::exception& e) {
                    sink_.add(internal_diagnostic(module->path, std::string("Analysis failed: ") + e.what()));
                    outcome.diagnostics = 1;
                } catch (...) {
                    sink_.add(internal_diagnostic(module->path, "Analysis failed: unknown exception"));
                    outcome.diagnostics = 1;
                }
                module->content.reset();
                completions_.send(outcome);
            });
        }
        analyzable.clear();

        parallel::help_until(pool_, [&] {
            while (auto outcome = completions_.try_receive()) {
                --pending;
                --stats_.retained_content;
                ++stats_.analyzed;
                stats_.rule_failures += outcome->rule_failures;
                stats_.fixes_applied += outcome->fixes_applied;
                if (outcome->written) {
                    ++stats_.files_written;
                }
            }
            return pending == 0;
        });
    }

    void GraphCoordinator::run_batch(const Batch& batch) {
        ++stats_.batches;

        transition(batch.index, BatchState::AwaitingEntries);
        for (const auto& path : batch.paths) {
            if (graph_.mark_dispatched(path)) {
                dispatch(path);
            }
        }

        transition(batch.index, BatchState::Draining);
        std::vector<fs::path> received;
        std::vector<ModulePtr> analyzable;

        parallel::help_until(pool_, [&] {
            while (auto module = results_.try_receive()) {
                --outstanding_;
                receive(std::move(*module), received, analyzable);
            }
            return outstanding_ == 0;
        });

        transition(batch.index, BatchState::ClosureComplete);
        for (const auto& path : received) {
            graph_.link(path);
        }
        log::logger()->debug("batch {}: closure of {} modules, {} to analyze",
                             batch.index, received.size(), analyzable.size());

        transition(batch.index, BatchState::Analyzing);
        analyze(std::move(analyzable));

        if (options_.release_dependency_edges) {
            for (const auto& path : received) {
                const auto* node = graph_.find(path);
                if (node != nullptr && !node->entry) {
                    graph_.release_edges(path);
                }
            }
        }

        transition(batch.index, BatchState::Released);
    }

}  // namespace modlint::runtime
