#include "modlint/analysis/executor.hpp"
#include "modlint/fix/fixer.hpp"
#include "modlint/log.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace modlint::analysis {

    namespace {

        Diagnostic file_diagnostic(
            const fs::path& path,
            const std::optional<std::size_t> segment,
            const std::string_view code,
            std::string message
        ) {
            Diagnostic d;
            d.path = path;
            d.segment = segment;
            d.severity = Severity::Error;
            d.code = std::string(code);
            d.message = std::move(message);
            return d;
        }

    }  // namespace

    AnalysisExecutor::AnalysisExecutor(
        rules::RuleSet rules,
        std::shared_ptr<const fsys::IFileSystem> file_system,
        DiagnosticCloner& sink,
        const ExecutorOptions options
    )
        : rules_(std::move(rules))
        , fs_(std::move(file_system))
        , sink_(sink)
        , options_(options) {}

    void AnalysisExecutor::run_rules(
        rules::RuleContext& ctx,
        const runtime::ProcessedModule& module,
        std::pmr::vector<LintMessage>& messages,
        FileAnalysis& result
    ) const {
        const std::optional<std::size_t> segment =
            module.composite ? std::optional<std::size_t>(ctx.segment_index()) : std::nullopt;

        for (const auto& configured : rules_) {
            if (configured.severity == Severity::Off) {
                continue;
            }
            const rules::IRule& rule = *configured.rule;
            if (rule.needs_graph() && ctx.graph() == nullptr) {
                continue;
            }

            ctx.set_current_rule(rule.name(), configured.severity);
            const std::size_t before = messages.size();

            std::string failure;
            try {
                if (auto status = rule.run(ctx); status.is_err()) {
                    failure = status.error().message();
                }
            } catch (const std::exception& e) {
                failure = e.what();
            } catch (...) {
                failure = "unknown exception";
            }

            if (failure.empty()) {
                continue;
            }

            // drop partial output of the failed rule
            messages.resize(before);
            ++result.rule_failures;
            log::logger()->warn("rule {} failed on {}: {}", rule.name(), module.path.string(), failure);

            Diagnostic d = file_diagnostic(
                module.path, segment, codes::rule_failure,
                "Rule '" + std::string(rule.name()) + "' failed: " + failure
            );
            d.help = "Other rules still ran on this file";
            sink_.add(std::move(d));
            ++result.diagnostics;
        }
    }

    FileAnalysis AnalysisExecutor::analyze(
        const runtime::ProcessedModule& module,
        const graph::ModuleGraph* graph
    ) const {
        FileAnalysis result;
        if (!module.content) {
            return result;
        }

        const runtime::Content& content = *module.content;
        memory::Arena& arena = content.lease.get();
        std::pmr::vector<LintMessage> messages(&arena);

        const auto segment_of = [&](const std::size_t index) {
            return module.composite ? std::optional<std::size_t>(index) : std::nullopt;
        };

        for (std::size_t i = 0; i < content.segments.size() && i < module.records.size(); ++i) {
            const auto& seg = content.segments[i];
            const auto& record = module.records[i];
            if (record.is_err() || seg.tree == nullptr) {
                continue;
            }

            rules::RuleContext ctx(
                arena, module.path, i, seg.segment, *seg.tree, seg.semantic,
                record.value().record.get(), graph, messages
            );
            run_rules(ctx, module, messages, result);

            for (const auto& request : record.value().requests) {
                if (request.resolved.is_ok()) {
                    continue;
                }
                Diagnostic d = file_diagnostic(
                    module.path, segment_of(i), codes::resolve, request.resolved.error().message()
                );
                d.span = request.span;
                sink_.add(std::move(d));
                ++result.diagnostics;
            }
        }

        // Merge the fixes of all segments into one write.
        std::vector<bool> fixed(messages.size(), false);
        if (options_.fix) {
            std::vector<Fix> fixes;
            std::vector<std::size_t> owners;
            for (std::size_t m = 0; m < messages.size(); ++m) {
                if (!messages[m].fix) continue;
                const std::uint32_t offset = content.segments[messages[m].segment].segment.offset;
                fixes.push_back(Fix{messages[m].fix->span.shifted(offset), std::string(messages[m].fix->content)});
                owners.push_back(m);
            }

            if (!fixes.empty()) {
                const auto outcome = fix::Fixer::apply(content.source_text, fixes);
                if (outcome.changed()) {
                    if (auto written = fs_->write(module.path, outcome.output); written.is_err()) {
                        sink_.add(file_diagnostic(
                            module.path, std::nullopt, codes::io,
                            "Failed to write fixes: " + written.error().message()
                        ));
                        ++result.diagnostics;
                    } else {
                        result.written = true;
                        result.fixes_applied = outcome.applied.size();
                        for (const std::size_t index : outcome.applied) {
                            fixed[owners[index]] = true;
                        }
                    }
                }
            }
        }

        for (std::size_t m = 0; m < messages.size(); ++m) {
            if (fixed[m]) continue;
            const auto& message = messages[m];
            sink_.clone(
                module.path,
                segment_of(message.segment),
                message,
                content.segments[message.segment].segment.offset
            );
            ++result.diagnostics;
        }

        return result;
    }

}  // namespace modlint::analysis
