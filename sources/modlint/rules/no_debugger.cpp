#include "modlint/rules/builtin_rules.hpp"

#include <memory>

namespace modlint::rules {

    Result<void, Error> NoDebuggerRule::run(RuleContext& ctx) const {
        for (const loader::Node* node : ctx.tree().body) {
            if (node->kind != loader::NodeKind::DebuggerStatement) {
                continue;
            }
            ctx.report_with_fix(node->span, "`debugger` statement is not allowed", node->span, "");
        }
        return Result<void, Error>::success();
    }

    void register_builtin_rules(RuleRegistry& registry) {
        registry.register_rule(std::make_unique<NoDebuggerRule>());
        registry.register_rule(std::make_unique<NoDuplicateImportsRule>());
        registry.register_rule(std::make_unique<NoUnusedImportsRule>());
        registry.register_rule(std::make_unique<NoSelfImportRule>());
        registry.register_rule(std::make_unique<NoCycleRule>());
        registry.register_rule(std::make_unique<ImportNamedRule>());
    }

}  // namespace modlint::rules
