#include "modlint/rules/rule.hpp"

namespace modlint::rules {

    // ============================================================================
    // RuleContext
    // ============================================================================

    RuleContext::RuleContext(
        memory::Arena& arena,
        const fs::path& path,
        const std::size_t segment_index,
        const loader::Segment& segment,
        const loader::StructuralTree& tree,
        const loader::SemanticModel* semantic,
        const graph::ModuleRecord* record,
        const graph::ModuleGraph* graph,
        std::pmr::vector<analysis::LintMessage>& sink
    )
        : arena_(arena)
        , path_(path)
        , segment_index_(segment_index)
        , segment_(segment)
        , tree_(tree)
        , semantic_(semantic)
        , record_(record)
        , graph_(graph)
        , sink_(sink) {}

    analysis::LintMessage& RuleContext::push(
        const Span span,
        const std::string_view message,
        const std::string_view help
    ) {
        analysis::LintMessage& m = sink_.emplace_back();
        m.segment = segment_index_;
        m.code = code_;
        m.message = arena_.copy_string(message);
        if (!help.empty()) {
            m.help = arena_.copy_string(help);
        }
        m.span = span;
        m.severity = severity_;
        return m;
    }

    void RuleContext::report(const Span span, const std::string_view message, const std::string_view help) {
        push(span, message, help);
    }

    void RuleContext::report_with_fix(
        const Span span,
        const std::string_view message,
        const Span fix_span,
        const std::string_view replacement
    ) {
        analysis::LintMessage& m = push(span, message, {});
        m.fix = analysis::ArenaFix{fix_span, arena_.copy_string(replacement)};
    }

    // ============================================================================
    // RuleRegistry
    // ============================================================================

    const RuleRegistry& RuleRegistry::builtin() {
        static const RuleRegistry registry = [] {
            RuleRegistry r;
            register_builtin_rules(r);
            return r;
        }();
        return registry;
    }

    void RuleRegistry::register_rule(std::unique_ptr<IRule> rule) {
        for (auto& existing : rules_) {
            if (existing->name() == rule->name()) {
                existing = std::move(rule);
                return;
            }
        }
        rules_.push_back(std::move(rule));
    }

    const IRule* RuleRegistry::get_rule(const std::string_view name) const {
        for (const auto& rule : rules_) {
            if (rule->name() == name) {
                return rule.get();
            }
        }
        return nullptr;
    }

    std::vector<const IRule*> RuleRegistry::list_rules() const {
        std::vector<const IRule*> result;
        result.reserve(rules_.size());
        for (const auto& rule : rules_) {
            result.push_back(rule.get());
        }
        return result;
    }

    RuleSet default_rule_set(const RuleRegistry& registry) {
        RuleSet set;
        for (const IRule* rule : registry.list_rules()) {
            set.push_back(ConfiguredRule{rule, rule->default_severity()});
        }
        return set;
    }

}  // namespace modlint::rules
