#include "modlint/rules/builtin_rules.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace modlint::rules {

    namespace {

        // ModuleRequest spans are file-absolute; rule reports are segment-relative.
        Span to_segment(const Span span, const std::uint32_t offset) {
            if (span.start < offset) {
                return span;
            }
            return Span{span.start - offset, span.end - offset};
        }

    }  // namespace

    // ============================================================================
    // no-duplicate-imports
    // ============================================================================

    Result<void, Error> NoDuplicateImportsRule::run(RuleContext& ctx) const {
        std::vector<std::pair<std::string_view, bool>> seen;

        for (const loader::Node* node : ctx.tree().body) {
            if (node->kind != loader::NodeKind::ImportDeclaration || !node->has_source) {
                continue;
            }

            bool duplicate = false;
            for (const auto& [source, type_only] : seen) {
                if (source == node->source && type_only == node->type_only) {
                    duplicate = true;
                    break;
                }
            }

            if (duplicate) {
                ctx.report(
                    node->source_span,
                    "'" + std::string(node->source) + "' import is duplicated",
                    "Merge the imports of this module into one declaration"
                );
            } else {
                seen.emplace_back(node->source, node->type_only);
            }
        }

        return Result<void, Error>::success();
    }

    // ============================================================================
    // no-unused-imports
    // ============================================================================

    Result<void, Error> NoUnusedImportsRule::run(RuleContext& ctx) const {
        const loader::SemanticModel* semantic = ctx.semantic();
        if (semantic == nullptr) {
            return Result<void, Error>::success();
        }

        for (const auto& binding : semantic->bindings()) {
            if (binding.kind != loader::BindingKind::Import || binding.name.empty()) {
                continue;
            }
            if (semantic->is_referenced(binding.name)) {
                continue;
            }
            ctx.report(
                binding.span,
                "'" + std::string(binding.name) + "' is imported but never used",
                "Remove the unused import"
            );
        }

        return Result<void, Error>::success();
    }

    // ============================================================================
    // no-self-import
    // ============================================================================

    Result<void, Error> NoSelfImportRule::run(RuleContext& ctx) const {
        const graph::ModuleRecord* record = ctx.record();
        if (record == nullptr) {
            return Result<void, Error>::success();
        }

        for (const auto& request : record->requests) {
            const auto it = record->loaded_modules.find(request.specifier);
            if (it == record->loaded_modules.end() || it->second == nullptr) {
                continue;
            }
            if (it->second->path == ctx.path()) {
                ctx.report(
                    to_segment(request.span, ctx.segment().offset),
                    "Module imports itself"
                );
            }
        }

        return Result<void, Error>::success();
    }

    // ============================================================================
    // import/no-cycle
    // ============================================================================

    Result<void, Error> NoCycleRule::run(RuleContext& ctx) const {
        const graph::ModuleRecord* record = ctx.record();
        const graph::ModuleGraph* graph = ctx.graph();
        if (record == nullptr || graph == nullptr) {
            return Result<void, Error>::success();
        }

        for (const auto& request : record->requests) {
            if (request.type_only) {
                continue;
            }
            const auto it = record->loaded_modules.find(request.specifier);
            if (it == record->loaded_modules.end() || it->second == nullptr) {
                continue;
            }
            const fs::path& target = it->second->path;
            if (target == ctx.path()) {
                continue;   // no-self-import reports this
            }

            const auto cycle = graph->find_path(target, ctx.path());
            if (!cycle) {
                continue;
            }

            std::string chain = ctx.path().filename().string();
            for (const auto& step : *cycle) {
                chain += " -> " + step.filename().string();
            }

            ctx.report(
                to_segment(request.span, ctx.segment().offset),
                "Dependency cycle detected",
                chain
            );
        }

        return Result<void, Error>::success();
    }

    // ============================================================================
    // import/named
    // ============================================================================

    Result<void, Error> ImportNamedRule::run(RuleContext& ctx) const {
        const graph::ModuleRecord* record = ctx.record();
        const graph::ModuleGraph* graph = ctx.graph();
        if (record == nullptr || graph == nullptr) {
            return Result<void, Error>::success();
        }

        for (const auto& entry : record->imports) {
            if (entry.type_only || entry.imported == "default" || entry.imported == "*") {
                continue;
            }
            const auto it = record->loaded_modules.find(entry.specifier);
            if (it == record->loaded_modules.end() || it->second == nullptr) {
                continue;
            }

            const graph::ModuleRecord* target = it->second;
            if (const graph::ModuleNode* node = graph->find(target->path); node != nullptr && node->failed) {
                continue;
            }
            if (target->has_star_reexport || target->export_names.empty()) {
                continue;
            }
            if (target->exports_name(entry.imported)) {
                continue;
            }

            ctx.report(
                to_segment(entry.span, ctx.segment().offset),
                "'" + entry.imported + "' is not exported by '" + entry.specifier + "'"
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace modlint::rules
