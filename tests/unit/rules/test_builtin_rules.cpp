#include "modlint/rules/builtin_rules.hpp"
#include "modlint/runtime/runtime.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

namespace modlint::rules
{
    namespace {

        /**
         * Runs one built-in rule over entries and returns the diagnostics it
         * produced.
         */
        Diagnostics lint_with(
            const std::string_view rule_name,
            const std::map<std::string, std::string>& files,
            const std::vector<fs::path>& entries,
            const std::optional<Severity> severity = std::nullopt
        ) {
            auto memory = std::make_shared<fsys::MemoryFileSystem>();
            for (const auto& [path, text] : files) {
                memory->add_file(path, text);
            }

            const IRule* rule = RuleRegistry::builtin().get_rule(rule_name);
            EXPECT_NE(rule, nullptr) << rule_name;

            runtime::RuntimeOptions options;
            options.concurrency = 1;
            runtime::Collaborators collaborators;
            collaborators.file_system = memory;
            collaborators.rules = RuleSet{ConfiguredRule{rule, severity.value_or(rule->default_severity())}};

            auto runtime = runtime::Runtime::create(options, std::move(collaborators)).value();
            runtime::RunReport report = runtime->run(entries).value();
            Diagnostics out;
            for (auto& d : report.diagnostics) {
                if (d.code == rule_name) {
                    out.push_back(std::move(d));
                }
            }
            return out;
        }

    }  // namespace

    TEST(RuleRegistryTest, BuiltinRules) {
        const auto rules = RuleRegistry::builtin().list_rules();
        ASSERT_EQ(rules.size(), 6u);
        EXPECT_EQ(rules[0]->name(), "no-debugger");
        EXPECT_EQ(rules[4]->name(), "import/no-cycle");
        EXPECT_EQ(rules[5]->name(), "import/named");
        EXPECT_EQ(RuleRegistry::builtin().get_rule("no-such-rule"), nullptr);

        EXPECT_TRUE(RuleRegistry::builtin().get_rule("no-debugger")->fixable());
        EXPECT_TRUE(RuleRegistry::builtin().get_rule("no-self-import")->needs_graph());
        EXPECT_FALSE(RuleRegistry::builtin().get_rule("no-unused-imports")->needs_graph());
    }

    TEST(RuleRegistryTest, DefaultSeverities) {
        const auto set = default_rule_set(RuleRegistry::builtin());
        ASSERT_EQ(set.size(), 6u);
        for (const auto& configured : set) {
            EXPECT_EQ(configured.severity, configured.rule->default_severity());
        }
        EXPECT_EQ(RuleRegistry::builtin().get_rule("import/no-cycle")->default_severity(), Severity::Off);
        EXPECT_EQ(RuleRegistry::builtin().get_rule("import/named")->default_severity(), Severity::Off);
    }

    TEST(RuleRegistryTest, RegisteringSameNameReplaces) {
        RuleRegistry registry;
        registry.register_rule(std::make_unique<NoDebuggerRule>());
        registry.register_rule(std::make_unique<NoDebuggerRule>());
        registry.register_rule(std::make_unique<NoSelfImportRule>());
        EXPECT_EQ(registry.list_rules().size(), 2u);
    }

    // ============================================================================
    // no-debugger
    // ============================================================================

    TEST(NoDebuggerTest, ReportsTopLevelAndNested) {
        const std::string source =
            "debugger;\n"
            "function f(x) {\n  if (x) { debugger }\n}\n"
            "const d = obj.debugger;\n";
        const auto diagnostics = lint_with("no-debugger", {{"/p/a.js", source}}, {"/p/a.js"});

        ASSERT_EQ(diagnostics.size(), 2u);
        EXPECT_EQ(diagnostics[0].span->start, 0u);
        EXPECT_EQ(diagnostics[1].span->start, source.find("debugger }"));
        EXPECT_EQ(diagnostics[0].severity, Severity::Error);
        EXPECT_EQ(diagnostics[0].message, "`debugger` statement is not allowed");
    }

    TEST(NoDebuggerTest, SeverityFollowsConfiguration) {
        const auto diagnostics = lint_with(
            "no-debugger", {{"/p/a.js", "debugger;"}}, {"/p/a.js"}, Severity::Warning);
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].severity, Severity::Warning);
    }

    // ============================================================================
    // no-duplicate-imports
    // ============================================================================

    TEST(NoDuplicateImportsTest, SecondDeclarationReported) {
        const std::string source =
            "import a from './x';\n"
            "import { b } from './x';\n"
            "import c from './y';\n"
            "export { a, b, c };\n";
        const auto diagnostics = lint_with(
            "no-duplicate-imports",
            {{"/p/a.js", source}, {"/p/x.js", ""}, {"/p/y.js", ""}},
            {"/p/a.js"});

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].span->start, source.find("'./x'", source.find('\n')));
        EXPECT_EQ(diagnostics[0].message, "'./x' import is duplicated");
        EXPECT_EQ(diagnostics[0].severity, Severity::Warning);
    }

    TEST(NoDuplicateImportsTest, TypeAndValueImportsAreDistinct) {
        const std::string source =
            "import type { T } from './x';\n"
            "import { v } from './x';\n"
            "export const y: T = v;\n";
        const auto diagnostics = lint_with(
            "no-duplicate-imports", {{"/p/a.ts", source}, {"/p/x.ts", ""}}, {"/p/a.ts"});
        EXPECT_TRUE(diagnostics.empty());
    }

    // ============================================================================
    // no-unused-imports
    // ============================================================================

    TEST(NoUnusedImportsTest, ReportsOnlyUnused) {
        const std::string source =
            "import def, { used, unused } from './x';\n"
            "import * as ns from './y';\n"
            "used(ns.value);\n";
        const auto diagnostics = lint_with(
            "no-unused-imports",
            {{"/p/a.js", source}, {"/p/x.js", ""}, {"/p/y.js", ""}},
            {"/p/a.js"});

        ASSERT_EQ(diagnostics.size(), 2u);
        std::vector<std::string> messages{diagnostics[0].message, diagnostics[1].message};
        std::sort(messages.begin(), messages.end());
        EXPECT_EQ(messages[0], "'def' is imported but never used");
        EXPECT_EQ(messages[1], "'unused' is imported but never used");
    }

    TEST(NoUnusedImportsTest, DependencyOnlyFilesNotChecked) {
        const auto diagnostics = lint_with(
            "no-unused-imports",
            {{"/p/a.js", "import './x';\n"}, {"/p/x.js", "import { z } from './a';\n"}},
            {"/p/a.js"});
        EXPECT_TRUE(diagnostics.empty());
    }

    // ============================================================================
    // no-self-import
    // ============================================================================

    TEST(NoSelfImportTest, ReportsImportOfSelf) {
        const std::string source = "import './a.js';\nimport './b';\n";
        const auto diagnostics = lint_with(
            "no-self-import", {{"/p/a.js", source}, {"/p/b.js", ""}}, {"/p/a.js"});

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].span->start, 7u);
        EXPECT_EQ(diagnostics[0].message, "Module imports itself");
    }

    TEST(NoSelfImportTest, ComponentSegmentSpansAreFileAbsolute) {
        const std::string source = "<template/>\n<script>\nimport './App.vue';\n</script>\n";
        const auto diagnostics = lint_with("no-self-import", {{"/p/App.vue", source}}, {"/p/App.vue"});

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].segment, std::optional<std::size_t>(0));
        EXPECT_EQ(diagnostics[0].span->start, source.find("'./App.vue'"));
    }

    // ============================================================================
    // import/no-cycle
    // ============================================================================

    TEST(NoCycleTest, ReportsChain) {
        const auto diagnostics = lint_with(
            "import/no-cycle",
            {{"/p/a.js", "import './b';\n"}, {"/p/b.js", "import './c';\n"}, {"/p/c.js", "import './a';\n"}},
            {"/p/a.js"},
            Severity::Error);

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].path, fs::path("/p/a.js"));
        EXPECT_EQ(diagnostics[0].message, "Dependency cycle detected");
        EXPECT_EQ(diagnostics[0].help, std::optional<std::string>("a.js -> b.js -> c.js -> a.js"));
    }

    TEST(NoCycleTest, AcyclicImportsPass) {
        const auto diagnostics = lint_with(
            "import/no-cycle",
            {{"/p/a.js", "import './b';\nimport './c';\n"}, {"/p/b.js", "import './c';\n"}, {"/p/c.js", ""}},
            {"/p/a.js"},
            Severity::Error);
        EXPECT_TRUE(diagnostics.empty());
    }

    TEST(NoCycleTest, OffByDefault) {
        const auto diagnostics = lint_with(
            "import/no-cycle",
            {{"/p/a.js", "import './b';\n"}, {"/p/b.js", "import './a';\n"}},
            {"/p/a.js"});
        EXPECT_TRUE(diagnostics.empty());
    }

    // ============================================================================
    // import/named
    // ============================================================================

    TEST(ImportNamedTest, ReportsMissingExport) {
        const std::string source = "import { used, missing as m } from './lib';\nused(m);\n";
        const auto diagnostics = lint_with(
            "import/named",
            {{"/p/a.js", source}, {"/p/lib.js", "export function used() {}\nexport const other = 1;\n"}},
            {"/p/a.js"},
            Severity::Error);

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].message, "'missing' is not exported by './lib'");
        ASSERT_TRUE(diagnostics[0].span.has_value());
        EXPECT_EQ(diagnostics[0].span->start, source.find("m }"));
    }

    TEST(ImportNamedTest, RenamedAndReExportedNamesPass) {
        const auto diagnostics = lint_with(
            "import/named",
            {{"/p/a.js", "import { x, y } from './lib';\nx(y);\n"},
             {"/p/lib.js", "const inner = 1;\nexport { inner as x };\nexport { y } from './other';\n"},
             {"/p/other.js", "export const y = 2;\n"}},
            {"/p/a.js"},
            Severity::Error);
        EXPECT_TRUE(diagnostics.empty());
    }

    TEST(ImportNamedTest, SkipsModulesItCannotJudge) {
        const auto diagnostics = lint_with(
            "import/named",
            {{"/p/a.js", "import { a } from './star';\nimport { b } from './cjs';\nimport type { C } from './types';\nimport d from './star';\na(b, d);\n"},
             {"/p/star.js", "export * from './cjs';\n"},
             {"/p/cjs.js", "module.exports = { b: 1 };\n"},
             {"/p/types.ts", "export const c = 1;\n"}},
            {"/p/a.js"},
            Severity::Error);
        EXPECT_TRUE(diagnostics.empty());
    }

    TEST(ImportNamedTest, OffByDefault) {
        const auto diagnostics = lint_with(
            "import/named",
            {{"/p/a.js", "import { nope } from './b';\nnope();\n"}, {"/p/b.js", "export const yes = 1;\n"}},
            {"/p/a.js"});
        EXPECT_TRUE(diagnostics.empty());
    }
}
