#include "modlint/runtime/runtime.hpp"
#include "modlint/analysis/diagnostic_cloner.hpp"
#include "modlint/analysis/executor.hpp"
#include "modlint/log.hpp"
#include "modlint/runtime/module_processor.hpp"
#include "modlint/runtime/path_set.hpp"
#include "modlint/utils/path_utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace modlint::runtime {

    const char* to_string(const ExitStatus status) noexcept {
        switch (status) {
            case ExitStatus::Clean:            return "clean";
            case ExitStatus::DiagnosticsFound: return "diagnostics-found";
            case ExitStatus::FatalError:       return "fatal-error";
        }
        return "unknown";
    }

    ExitStatus status_for(
        const std::size_t errors,
        const std::size_t warnings,
        const RuntimeOptions& options
    ) noexcept {
        if (errors > 0) {
            return ExitStatus::DiagnosticsFound;
        }
        if (options.deny_warnings && warnings > 0) {
            return ExitStatus::DiagnosticsFound;
        }
        if (options.max_warnings && warnings > *options.max_warnings) {
            return ExitStatus::DiagnosticsFound;
        }
        return ExitStatus::Clean;
    }

    std::size_t RunReport::error_count() const noexcept {
        return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
            [](const Diagnostic& d) { return d.severity == Severity::Error; }));
    }

    std::size_t RunReport::warning_count() const noexcept {
        return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
            [](const Diagnostic& d) { return d.severity == Severity::Warning; }));
    }

    Result<std::unique_ptr<Runtime>, Error> Runtime::create(
        RuntimeOptions options,
        Collaborators collaborators
    ) {
        using R = Result<std::unique_ptr<Runtime>, Error>;

        if (options.batch_multiplier == 0) {
            return R::failure(Error::config_error("Batch multiplier must be at least 1"));
        }
        if (options.arena_block_size == 0) {
            return R::failure(Error::config_error("Arena block size must be non-zero"));
        }
        if (options.concurrency == 0) {
            options.concurrency = parallel::hardware_concurrency();
        }

        auto arenas = memory::ArenaPool::create(options.concurrency, options.arena_block_size);
        if (arenas.is_err()) {
            return R::failure(arenas.error());
        }

        return R::success(std::unique_ptr<Runtime>(
            new Runtime(std::move(options), std::move(collaborators), std::move(arenas).value())
        ));
    }

    Runtime::Runtime(
        RuntimeOptions options,
        Collaborators collaborators,
        std::unique_ptr<memory::ArenaPool> arenas
    )
        : options_(std::move(options))
        , fs_(std::move(collaborators.file_system))
        , loaders_(std::move(collaborators.loaders))
        , resolver_(std::move(collaborators.resolver))
        , arenas_(std::move(arenas))
        , pool_(std::make_unique<parallel::ThreadPool>(options_.concurrency))
        , graph_(std::make_unique<graph::ModuleGraph>()) {
        if (!fs_) {
            fs_ = std::make_shared<fsys::OsFileSystem>();
        }
        if (!loaders_) {
            loaders_ = std::make_shared<loader::LoaderRegistry>(loader::LoaderRegistry::with_defaults());
        }
        if (!resolver_ && options_.cross_module) {
            resolver_ = std::make_shared<resolver::RelativeResolver>(fs_);
        }
        if (!options_.cross_module) {
            resolver_.reset();
        }
        rules_ = collaborators.rules
            ? std::move(*collaborators.rules)
            : rules::default_rule_set(rules::RuleRegistry::builtin());
    }

    Result<RunReport, Error> Runtime::run(const std::vector<fs::path>& paths) {
        if (paths.empty()) {
            return Result<RunReport, Error>::failure(Error::invalid_argument("No paths to lint"));
        }

        fs::path base = options_.cwd;
        if (base.empty()) {
            std::error_code ec;
            base = fs::current_path(ec);
            if (ec) {
                return Result<RunReport, Error>::failure(
                    Error::io_error("Cannot determine working directory", ec.message())
                );
            }
        }

        PathSet entries;
        for (const auto& p : paths) {
            entries.insert(path_utils::absolute_from(p, base));
        }

        graph_ = std::make_unique<graph::ModuleGraph>();
        analysis::DiagnosticCloner sink;

        ProcessorOptions processor_options;
        processor_options.extract_dependency_imports = options_.extract_dependency_imports;
        processor_options.retain_dependency_content = options_.retain_dependency_content;
        const ModuleProcessor processor(fs_, loaders_, resolver_, *arenas_, processor_options);

        analysis::ExecutorOptions executor_options;
        executor_options.fix = options_.fix;
        const analysis::AnalysisExecutor executor(rules_, fs_, sink, executor_options);

        CoordinatorOptions coordinator_options;
        coordinator_options.cross_module = options_.cross_module;
        coordinator_options.release_dependency_edges = options_.release_dependency_edges;
        GraphCoordinator coordinator(processor, executor, *pool_, *graph_, sink, entries, coordinator_options);
        if (on_state_) {
            coordinator.set_state_callback(on_state_);
        }

        ScheduleOptions schedule_options;
        schedule_options.batch_multiplier = options_.batch_multiplier;
        schedule_options.ordering = options_.ordering;
        const auto batches = schedule(entries, pool_->size(), schedule_options);

        log::logger()->info("linting {} paths in {} batches on {} threads",
                            entries.size(), batches.size(), pool_->size());

        for (const auto& batch : batches) {
            coordinator.run_batch(batch);
        }

        RunReport report;
        report.diagnostics = sink.take();
        std::sort(report.diagnostics.begin(), report.diagnostics.end(), diagnostic_less);
        report.status = status_for(report.error_count(), report.warning_count(), options_);

        const auto& cs = coordinator.stats();
        const auto gs = graph_->stats();
        report.stats.input_paths = entries.size();
        report.stats.batches = cs.batches;
        report.stats.modules = gs.node_count;
        report.stats.edges = gs.edge_count;
        report.stats.processed = cs.processed;
        report.stats.analyzed = cs.analyzed;
        report.stats.failed = cs.failed;
        report.stats.unsupported = cs.unsupported;
        report.stats.rule_failures = cs.rule_failures;
        report.stats.fixes_applied = cs.fixes_applied;
        report.stats.files_written = cs.files_written;
        report.stats.peak_retained_content = cs.peak_retained_content;
        report.stats.arenas_created = arenas_->stats().created;

        log::logger()->info("{} modules, {} diagnostics ({} errors, {} warnings)",
                            report.stats.modules, report.diagnostics.size(),
                            report.error_count(), report.warning_count());

        return Result<RunReport, Error>::success(std::move(report));
    }

}  // namespace modlint::runtime
