#ifndef MODLINT_EXECUTOR_HPP
#define MODLINT_EXECUTOR_HPP

/**
 * @file executor.hpp
 * @brief Runs the rule set over one processed module.
 *
 * For every segment that parsed, the configured rules run with their own
 * RuleContext. Messages of all segments are gathered per file, their spans
 * made file-absolute, and the proposed fixes merged and written in a single
 * write. Surviving messages are cloned into the run report.
 *
 * A rule that throws or returns an error does not stop the others; the
 * failure is reported as a rule-failure diagnostic on the file.
 */

#include "modlint/analysis/diagnostic_cloner.hpp"
#include "modlint/fs/file_system.hpp"
#include "modlint/graph/module_graph.hpp"
#include "modlint/rules/rule.hpp"
#include "modlint/runtime/module_processor.hpp"

#include <cstddef>
#include <memory>

namespace modlint::analysis {

    struct ExecutorOptions {
        bool fix = false;
    };

    /**
     * Summary of one file's analysis.
     */
    struct FileAnalysis {
        std::size_t diagnostics = 0;
        std::size_t rule_failures = 0;
        std::size_t fixes_applied = 0;
        bool written = false;
    };

    class AnalysisExecutor {
    public:
        AnalysisExecutor(
            rules::RuleSet rules,
            std::shared_ptr<const fsys::IFileSystem> file_system,
            DiagnosticCloner& sink,
            ExecutorOptions options = {}
        );

        /**
         * Analyzes a module that carries Content. Modules without Content
         * are ignored.
         *
         * @param graph Read-only module graph, or null when cross-module
         *              analysis is off.
         */
        FileAnalysis analyze(const runtime::ProcessedModule& module, const graph::ModuleGraph* graph) const;

        [[nodiscard]] const rules::RuleSet& rules() const noexcept {
            return rules_;
        }

    private:
        void run_rules(
            rules::RuleContext& ctx,
            const runtime::ProcessedModule& module,
            std::pmr::vector<LintMessage>& messages,
            FileAnalysis& result
        ) const;

        rules::RuleSet rules_;
        std::shared_ptr<const fsys::IFileSystem> fs_;
        DiagnosticCloner& sink_;
        ExecutorOptions options_;
    };

}  // namespace modlint::analysis

#endif // MODLINT_EXECUTOR_HPP
