#include "modlint/analysis/executor.hpp"
#include "modlint/rules/builtin_rules.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace modlint::analysis
{
    namespace {

        class ThrowingRule final : public rules::IRule {
        public:
            [[nodiscard]] std::string_view name() const noexcept override { return "test/throws"; }
            [[nodiscard]] std::string_view description() const noexcept override { return "throws"; }
            [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Error; }

            [[nodiscard]] Result<void, Error> run(rules::RuleContext&) const override {
                throw std::runtime_error("boom");
            }
        };

        class ThrowingIntRule final : public rules::IRule {
        public:
            [[nodiscard]] std::string_view name() const noexcept override { return "test/throws-int"; }
            [[nodiscard]] std::string_view description() const noexcept override { return "throws an int"; }
            [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Error; }

            [[nodiscard]] Result<void, Error> run(rules::RuleContext&) const override {
                throw 42;
            }
        };

        /**
         * Reports once, then gives up.
         */
        class HalfwayRule final : public rules::IRule {
        public:
            [[nodiscard]] std::string_view name() const noexcept override { return "test/halfway"; }
            [[nodiscard]] std::string_view description() const noexcept override { return "fails"; }
            [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Error; }

            [[nodiscard]] Result<void, Error> run(rules::RuleContext& ctx) const override {
                ctx.report(Span{0, 1}, "partial");
                return Result<void, Error>::failure(Error::analysis_error("gave up"));
            }
        };

        class GraphOnlyRule final : public rules::IRule {
        public:
            [[nodiscard]] std::string_view name() const noexcept override { return "test/graph"; }
            [[nodiscard]] std::string_view description() const noexcept override { return "graph"; }
            [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Warning; }
            [[nodiscard]] bool needs_graph() const noexcept override { return true; }

            [[nodiscard]] Result<void, Error> run(rules::RuleContext& ctx) const override {
                ctx.report(Span{0, 0}, "saw graph");
                return Result<void, Error>::success();
            }
        };

        class FailingWrites final : public fsys::IFileSystem {
        public:
            [[nodiscard]] Result<std::string_view, Error> read_to_arena(
                const fs::path& path, memory::Arena&) const override {
                return Result<std::string_view, Error>::failure(Error::io_error("not readable", path.string()));
            }
            [[nodiscard]] Result<void, Error> write(const fs::path& path, std::string_view) const override {
                return Result<void, Error>::failure(Error::io_error("Read-only file system", path.string()));
            }
            [[nodiscard]] bool is_file(const fs::path&) const override { return false; }
        };

        std::size_t count_code(const Diagnostics& diagnostics, const std::string_view code) {
            return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                [&](const Diagnostic& d) { return d.code == code; }));
        }

    }  // namespace

    class AnalysisExecutorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            fs_ = std::make_shared<fsys::MemoryFileSystem>();
            loaders_ = std::make_shared<loader::LoaderRegistry>(loader::LoaderRegistry::with_defaults());
            pool_ = memory::ArenaPool::create(1, 4096).value();
        }

        runtime::ProcessedModule process(const fs::path& path) {
            const runtime::ModuleProcessor processor(fs_, loaders_, nullptr, *pool_);
            return processor.process(path, true);
        }

        const rules::IRule* builtin(const std::string_view name) {
            return rules::RuleRegistry::builtin().get_rule(name);
        }

        std::shared_ptr<fsys::MemoryFileSystem> fs_;
        std::shared_ptr<loader::LoaderRegistry> loaders_;
        std::unique_ptr<memory::ArenaPool> pool_;
        DiagnosticCloner sink_;
    };

    TEST_F(AnalysisExecutorTest, ThrowingRuleDoesNotStopOthers) {
        fs_->add_file("/p/a.js", "debugger;\n");
        const ThrowingRule throwing;
        const AnalysisExecutor executor(
            {{&throwing, Severity::Error}, {builtin("no-debugger"), Severity::Error}}, fs_, sink_);

        const auto module = process("/p/a.js");
        const FileAnalysis outcome = executor.analyze(module, nullptr);

        EXPECT_EQ(outcome.rule_failures, 1u);
        EXPECT_EQ(outcome.diagnostics, 2u);

        const Diagnostics diagnostics = sink_.take();
        ASSERT_EQ(count_code(diagnostics, "rule-failure"), 1u);
        EXPECT_EQ(count_code(diagnostics, "no-debugger"), 1u);

        const auto failure = std::find_if(diagnostics.begin(), diagnostics.end(),
            [](const Diagnostic& d) { return d.code == "rule-failure"; });
        EXPECT_EQ(failure->message, "Rule 'test/throws' failed: boom");
        EXPECT_EQ(failure->path, fs::path("/p/a.js"));
        EXPECT_FALSE(failure->span.has_value());
    }

    TEST_F(AnalysisExecutorTest, NonStandardExceptionIsRuleFailure) {
        fs_->add_file("/p/a.js", "debugger;\n");
        const ThrowingIntRule throwing;
        const AnalysisExecutor executor(
            {{&throwing, Severity::Error}, {builtin("no-debugger"), Severity::Error}}, fs_, sink_);

        const FileAnalysis outcome = executor.analyze(process("/p/a.js"), nullptr);
        EXPECT_EQ(outcome.rule_failures, 1u);

        const Diagnostics diagnostics = sink_.take();
        EXPECT_EQ(count_code(diagnostics, "no-debugger"), 1u);
        const auto failure = std::find_if(diagnostics.begin(), diagnostics.end(),
            [](const Diagnostic& d) { return d.code == "rule-failure"; });
        ASSERT_NE(failure, diagnostics.end());
        EXPECT_EQ(failure->message, "Rule 'test/throws-int' failed: unknown exception");
    }

    TEST_F(AnalysisExecutorTest, ErrorResultDropsPartialOutput) {
        fs_->add_file("/p/a.js", "const a = 1;\n");
        const HalfwayRule halfway;
        const AnalysisExecutor executor({{&halfway, Severity::Error}}, fs_, sink_);

        const FileAnalysis outcome = executor.analyze(process("/p/a.js"), nullptr);
        EXPECT_EQ(outcome.rule_failures, 1u);

        const Diagnostics diagnostics = sink_.take();
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].code, "rule-failure");
        EXPECT_EQ(diagnostics[0].message, "Rule 'test/halfway' failed: gave up");
    }

    TEST_F(AnalysisExecutorTest, OffRulesAndGraphRulesSkipped) {
        fs_->add_file("/p/a.js", "debugger;\n");
        const GraphOnlyRule graph_rule;
        const AnalysisExecutor executor(
            {{builtin("no-debugger"), Severity::Off}, {&graph_rule, Severity::Warning}}, fs_, sink_);

        const auto module = process("/p/a.js");
        EXPECT_EQ(executor.analyze(module, nullptr).diagnostics, 0u);
        EXPECT_EQ(sink_.size(), 0u);

        const graph::ModuleGraph graph;
        EXPECT_EQ(executor.analyze(module, &graph).diagnostics, 1u);
        const Diagnostics diagnostics = sink_.take();
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].code, "test/graph");
        EXPECT_EQ(diagnostics[0].severity, Severity::Warning);
    }

    TEST_F(AnalysisExecutorTest, ModuleWithoutContentIgnored) {
        runtime::ProcessedModule module;
        module.path = "/p/x.js";
        const AnalysisExecutor executor(rules::default_rule_set(rules::RuleRegistry::builtin()), fs_, sink_);

        const FileAnalysis outcome = executor.analyze(module, nullptr);
        EXPECT_EQ(outcome.diagnostics, 0u);
        EXPECT_FALSE(outcome.written);
    }

    TEST_F(AnalysisExecutorTest, FixesMergedIntoOneWrite) {
        const std::string source =
            "<script>\ndebugger;\nconst a = 1;\n</script>\n"
            "<template><p/></template>\n"
            "<script setup>\ndebugger;\n</script>\n";
        fs_->add_file("/p/App.vue", source);
        const AnalysisExecutor executor(
            {{builtin("no-debugger"), Severity::Error}}, fs_, sink_, ExecutorOptions{.fix = true});

        const FileAnalysis outcome = executor.analyze(process("/p/App.vue"), nullptr);
        EXPECT_TRUE(outcome.written);
        EXPECT_EQ(outcome.fixes_applied, 2u);
        EXPECT_EQ(fs_->write_count("/p/App.vue"), 1u);
        EXPECT_EQ(sink_.size(), 0u);

        EXPECT_EQ(fs_->content("/p/App.vue"),
            std::optional<std::string>(
                "<script>\n\nconst a = 1;\n</script>\n"
                "<template><p/></template>\n"
                "<script setup>\n\n</script>\n"));
    }

    TEST_F(AnalysisExecutorTest, WithoutFixNothingIsWritten) {
        fs_->add_file("/p/a.js", "debugger;\n");
        const AnalysisExecutor executor({{builtin("no-debugger"), Severity::Error}}, fs_, sink_);

        const FileAnalysis outcome = executor.analyze(process("/p/a.js"), nullptr);
        EXPECT_FALSE(outcome.written);
        EXPECT_EQ(fs_->total_writes(), 0u);
        EXPECT_EQ(sink_.size(), 1u);
    }

    TEST_F(AnalysisExecutorTest, FailedWriteKeepsDiagnostics) {
        fs_->add_file("/p/a.js", "debugger;\n");
        const AnalysisExecutor executor(
            {{builtin("no-debugger"), Severity::Error}},
            std::make_shared<FailingWrites>(), sink_, ExecutorOptions{.fix = true});

        const FileAnalysis outcome = executor.analyze(process("/p/a.js"), nullptr);
        EXPECT_FALSE(outcome.written);
        EXPECT_EQ(outcome.fixes_applied, 0u);

        const Diagnostics diagnostics = sink_.take();
        EXPECT_EQ(count_code(diagnostics, "io"), 1u);
        EXPECT_EQ(count_code(diagnostics, "no-debugger"), 1u);
    }

    TEST_F(AnalysisExecutorTest, SegmentIndexOnlyForComponents) {
        fs_->add_file("/p/a.js", "debugger;\n");
        fs_->add_file("/p/B.svelte", "<script>\ndebugger;\n</script>\n");
        const AnalysisExecutor executor({{builtin("no-debugger"), Severity::Error}}, fs_, sink_);

        (void)executor.analyze(process("/p/a.js"), nullptr);
        (void)executor.analyze(process("/p/B.svelte"), nullptr);

        Diagnostics diagnostics = sink_.take();
        std::sort(diagnostics.begin(), diagnostics.end(), diagnostic_less);
        ASSERT_EQ(diagnostics.size(), 2u);
        EXPECT_EQ(diagnostics[0].path, fs::path("/p/B.svelte"));
        EXPECT_EQ(diagnostics[0].segment, std::optional<std::size_t>(0));
        EXPECT_EQ(diagnostics[0].span->start, 9u);
        EXPECT_FALSE(diagnostics[1].segment.has_value());
    }
}
