#ifndef MODLINT_RULE_HPP
#define MODLINT_RULE_HPP

/**
 * @file rule.hpp
 * @brief Rule interface, per-segment rule context and the rule registry.
 *
 * A rule inspects one segment through a RuleContext and reports problems
 * into it. Built-in rules:
 * - no-debugger: debugger statements (fixable)
 * - no-duplicate-imports: one specifier imported by several declarations
 * - no-unused-imports: imported bindings never referenced
 * - no-self-import: a module importing itself
 * - import/no-cycle: an import that leads back to the importing module
 */

#include "modlint/analysis/lint_message.hpp"
#include "modlint/graph/module_graph.hpp"
#include "modlint/graph/module_record.hpp"
#include "modlint/loader/ast.hpp"
#include "modlint/loader/semantic.hpp"
#include "modlint/loader/splitter.hpp"
#include "modlint/memory/arena.hpp"
#include "modlint/result.hpp"
#include "modlint/error.hpp"
#include "modlint/types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

namespace modlint::rules {

    namespace fs = std::filesystem;

    /**
     * What a rule may look at while analyzing one segment.
     *
     * Spans passed to report() are segment-relative, like the tree's.
     */
    class RuleContext {
    public:
        RuleContext(
            memory::Arena& arena,
            const fs::path& path,
            std::size_t segment_index,
            const loader::Segment& segment,
            const loader::StructuralTree& tree,
            const loader::SemanticModel* semantic,
            const graph::ModuleRecord* record,
            const graph::ModuleGraph* graph,
            std::pmr::vector<analysis::LintMessage>& sink
        );

        [[nodiscard]] const fs::path& path() const noexcept { return path_; }
        [[nodiscard]] std::size_t segment_index() const noexcept { return segment_index_; }
        [[nodiscard]] const loader::Segment& segment() const noexcept { return segment_; }
        [[nodiscard]] const loader::StructuralTree& tree() const noexcept { return tree_; }
        [[nodiscard]] std::string_view source_text() const noexcept { return segment_.text; }

        /**
         * Null when the semantic pass was not run for this file.
         */
        [[nodiscard]] const loader::SemanticModel* semantic() const noexcept { return semantic_; }

        [[nodiscard]] const graph::ModuleRecord* record() const noexcept { return record_; }

        /**
         * Null when cross-module analysis is disabled.
         */
        [[nodiscard]] const graph::ModuleGraph* graph() const noexcept { return graph_; }

        void report(Span span, std::string_view message, std::string_view help = {});

        void report_with_fix(Span span, std::string_view message, Span fix_span, std::string_view replacement);

        /**
         * Called by the executor before each rule runs.
         */
        void set_current_rule(std::string_view code, Severity severity) noexcept {
            code_ = code;
            severity_ = severity;
        }

    private:
        analysis::LintMessage& push(Span span, std::string_view message, std::string_view help);

        memory::Arena& arena_;
        const fs::path& path_;
        std::size_t segment_index_;
        const loader::Segment& segment_;
        const loader::StructuralTree& tree_;
        const loader::SemanticModel* semantic_;
        const graph::ModuleRecord* record_;
        const graph::ModuleGraph* graph_;
        std::pmr::vector<analysis::LintMessage>& sink_;

        std::string_view code_;
        Severity severity_ = Severity::Error;
    };

    /**
     * Base interface for all rules.
     */
    class IRule {
    public:
        virtual ~IRule() = default;

        /**
         * Returns the rule name, also used as the diagnostic code.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual Severity default_severity() const noexcept = 0;

        [[nodiscard]] virtual bool fixable() const noexcept { return false; }

        /**
         * Rules that need the module graph are skipped when cross-module
         * analysis is disabled.
         */
        [[nodiscard]] virtual bool needs_graph() const noexcept { return false; }

        /**
         * Analyzes one segment.
         *
         * @return An error when the rule could not complete; the executor
         *         turns it into a rule-failure diagnostic.
         */
        [[nodiscard]] virtual Result<void, Error> run(RuleContext& ctx) const = 0;
    };

    /**
     * Registry for managing rules.
     */
    class RuleRegistry {
    public:
        RuleRegistry() = default;

        /**
         * Registry holding the built-in rules.
         */
        static const RuleRegistry& builtin();

        void register_rule(std::unique_ptr<IRule> rule);

        [[nodiscard]] const IRule* get_rule(std::string_view name) const;
        [[nodiscard]] std::vector<const IRule*> list_rules() const;

    private:
        std::vector<std::unique_ptr<IRule>> rules_;
    };

    struct ConfiguredRule {
        const IRule* rule = nullptr;
        Severity severity = Severity::Error;
    };

    using RuleSet = std::vector<ConfiguredRule>;

    /**
     * Every rule of registry at its default severity, in registration order.
     */
    [[nodiscard]] RuleSet default_rule_set(const RuleRegistry& registry);

    /**
     * Adds the built-in rules to registry.
     */
    void register_builtin_rules(RuleRegistry& registry);

}  // namespace modlint::rules

#endif // MODLINT_RULE_HPP
