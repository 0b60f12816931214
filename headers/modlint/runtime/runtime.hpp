#ifndef MODLINT_RUNTIME_HPP
#define MODLINT_RUNTIME_HPP

/**
 * @file runtime.hpp
 * @brief Entry point of a lint run.
 *
 * Runtime wires the default or caller-supplied collaborators together,
 * schedules the input paths into batches and drives each batch through the
 * graph coordinator. The report is sorted and independent of scheduling.
 *
 * @code
 *     auto runtime = Runtime::create(RuntimeOptions{}).value();
 *     auto report = runtime->run({"src/app.ts"});
 *     if (report.is_ok()) {
 *         for (const auto& d : report.value().diagnostics) {
 *             std::cout << format_diagnostic(d) << "\n";
 *         }
 *     }
 * @endcode
 */

#include "modlint/fs/file_system.hpp"
#include "modlint/graph/module_graph.hpp"
#include "modlint/loader/loader_registry.hpp"
#include "modlint/memory/arena_pool.hpp"
#include "modlint/resolver/resolver.hpp"
#include "modlint/rules/rule.hpp"
#include "modlint/runtime/coordinator.hpp"
#include "modlint/runtime/scheduler.hpp"
#include "modlint/utils/parallel.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace modlint::runtime {

    struct RuntimeOptions {
        /**
         * Worker threads (0 = hardware concurrency).
         */
        unsigned int concurrency = 0;

        std::size_t batch_multiplier = DEFAULT_BATCH_MULTIPLIER;
        Ordering ordering = Ordering::DepthFirst;

        bool fix = false;

        /**
         * Resolve imports and expose the module graph to rules.
         */
        bool cross_module = true;

        bool extract_dependency_imports = true;
        bool retain_dependency_content = false;
        bool release_dependency_edges = false;

        /**
         * Any warning makes the run DiagnosticsFound.
         */
        bool deny_warnings = false;

        /**
         * More warnings than this make the run DiagnosticsFound.
         */
        std::optional<std::size_t> max_warnings;

        std::size_t arena_block_size = memory::DEFAULT_BLOCK_SIZE;

        /**
         * Base for relative input paths (empty = current directory).
         */
        fs::path cwd;
    };

    /**
     * Replaceable collaborators. Null members get the defaults.
     */
    struct Collaborators {
        std::shared_ptr<const fsys::IFileSystem> file_system;
        std::shared_ptr<const loader::LoaderRegistry> loaders;
        std::shared_ptr<const resolver::IDependencyResolver> resolver;
        std::optional<rules::RuleSet> rules;
    };

    enum class ExitStatus {
        Clean,
        DiagnosticsFound,
        FatalError
    };

    [[nodiscard]] const char* to_string(ExitStatus status) noexcept;

    [[nodiscard]] inline int exit_code(const ExitStatus status) noexcept {
        switch (status) {
            case ExitStatus::Clean:            return 0;
            case ExitStatus::DiagnosticsFound: return 1;
            case ExitStatus::FatalError:       return 2;
        }
        return 2;
    }

    /**
     * DiagnosticsFound when there is an error, or when the warnings break
     * deny_warnings or max_warnings of options; Clean otherwise.
     */
    [[nodiscard]] ExitStatus status_for(
        std::size_t errors,
        std::size_t warnings,
        const RuntimeOptions& options
    ) noexcept;

    struct RunStatistics {
        std::size_t input_paths = 0;
        std::size_t batches = 0;
        std::size_t modules = 0;
        std::size_t edges = 0;
        std::size_t processed = 0;
        std::size_t analyzed = 0;
        std::size_t failed = 0;
        std::size_t unsupported = 0;
        std::size_t rule_failures = 0;
        std::size_t fixes_applied = 0;
        std::size_t files_written = 0;
        std::size_t peak_retained_content = 0;
        std::size_t arenas_created = 0;
    };

    struct RunReport {
        Diagnostics diagnostics;
        ExitStatus status = ExitStatus::Clean;
        RunStatistics stats;

        [[nodiscard]] std::size_t error_count() const noexcept;
        [[nodiscard]] std::size_t warning_count() const noexcept;
    };

    class Runtime {
    public:
        /**
         * Validates options and builds the pools.
         *
         * Fails with ConfigError on a zero batch multiplier or arena block
         * size.
         */
        [[nodiscard]] static Result<std::unique_ptr<Runtime>, Error> create(
            RuntimeOptions options,
            Collaborators collaborators = {}
        );

        Runtime(const Runtime&) = delete;
        Runtime& operator=(const Runtime&) = delete;

        /**
         * Lints paths and everything they import.
         *
         * Only an empty path list fails; per-file problems are diagnostics.
         * Each call starts from an empty module graph.
         */
        [[nodiscard]] Result<RunReport, Error> run(const std::vector<fs::path>& paths);

        /**
         * Graph of the last run.
         */
        [[nodiscard]] const graph::ModuleGraph& graph() const noexcept {
            return *graph_;
        }

        void set_state_callback(StateCallback callback) {
            on_state_ = std::move(callback);
        }

        [[nodiscard]] const RuntimeOptions& options() const noexcept {
            return options_;
        }

        [[nodiscard]] std::size_t concurrency() const noexcept {
            return pool_->size();
        }

    private:
        Runtime(
            RuntimeOptions options,
            Collaborators collaborators,
            std::unique_ptr<memory::ArenaPool> arenas
        );

        RuntimeOptions options_;
        std::shared_ptr<const fsys::IFileSystem> fs_;
        std::shared_ptr<const loader::LoaderRegistry> loaders_;
        std::shared_ptr<const resolver::IDependencyResolver> resolver_;
        rules::RuleSet rules_;

        std::unique_ptr<memory::ArenaPool> arenas_;
        std::unique_ptr<parallel::ThreadPool> pool_;
        std::unique_ptr<graph::ModuleGraph> graph_;
        StateCallback on_state_;
    };

}  // namespace modlint::runtime

#endif // MODLINT_RUNTIME_HPP
