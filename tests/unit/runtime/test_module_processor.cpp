#include "modlint/runtime/module_processor.hpp"

#include <gtest/gtest.h>

namespace modlint::runtime
{
    class ModuleProcessorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            fs_ = std::make_shared<fsys::MemoryFileSystem>();
            loaders_ = std::make_shared<loader::LoaderRegistry>(loader::LoaderRegistry::with_defaults());
            resolver_ = std::make_shared<resolver::RelativeResolver>(fs_);
            pool_ = memory::ArenaPool::create(2, 4096).value();
        }

        ModuleProcessor make(ProcessorOptions options = {}) {
            return ModuleProcessor(fs_, loaders_, resolver_, *pool_, options);
        }

        std::shared_ptr<fsys::MemoryFileSystem> fs_;
        std::shared_ptr<loader::LoaderRegistry> loaders_;
        std::shared_ptr<resolver::RelativeResolver> resolver_;
        std::unique_ptr<memory::ArenaPool> pool_;
    };

    TEST_F(ModuleProcessorTest, EntryKeepsContentAndResolvesImports) {
        fs_->add_file("/p/a.js", "import { b } from './b';\nimport x from 'pkg';\nexport const a = b;\n");
        fs_->add_file("/p/b.js", "export const b = 1;\n");

        const auto processor = make();
        const ProcessedModule module = processor.process("/p/a.js", true);

        EXPECT_TRUE(module.supported);
        EXPECT_FALSE(module.composite);
        EXPECT_FALSE(module.failed());
        ASSERT_EQ(module.records.size(), 1u);

        const auto& resolved = module.records[0].value();
        ASSERT_EQ(resolved.record->requests.size(), 2u);
        EXPECT_EQ(resolved.record->requests[0].specifier, "./b");
        EXPECT_TRUE(resolved.record->exports_name("a"));

        // bare specifiers are not resolved
        ASSERT_EQ(resolved.requests.size(), 1u);
        ASSERT_TRUE(resolved.requests[0].resolved.is_ok());
        EXPECT_EQ(resolved.requests[0].resolved.value(), fs::path("/p/b.js"));
        EXPECT_EQ(resolved.requests[0].span.start, 18u);

        ASSERT_TRUE(module.content.has_value());
        EXPECT_FALSE(module.content->source_text.empty());
        ASSERT_EQ(module.content->segments.size(), 1u);
        EXPECT_NE(module.content->segments[0].tree, nullptr);
        EXPECT_NE(module.content->segments[0].semantic, nullptr);
    }

    TEST_F(ModuleProcessorTest, DependencyDropsContent) {
        fs_->add_file("/p/b.js", "import './c';\n");

        const auto processor = make();
        const ProcessedModule module = processor.process("/p/b.js", false);

        EXPECT_FALSE(module.content.has_value());
        ASSERT_EQ(module.records.size(), 1u);
        ASSERT_TRUE(module.records[0].is_ok());
        EXPECT_EQ(module.records[0].value().record->requests.size(), 1u);

        // arena went straight back to the pool
        EXPECT_EQ(pool_->stats().leased, 0u);
    }

    TEST_F(ModuleProcessorTest, RetainedDependencyKeepsContent) {
        fs_->add_file("/p/b.js", "debugger;\n");

        const auto processor = make({.extract_dependency_imports = true, .retain_dependency_content = true});
        const ProcessedModule module = processor.process("/p/b.js", false);

        ASSERT_TRUE(module.content.has_value());
        EXPECT_EQ(pool_->stats().leased, 1u);
    }

    TEST_F(ModuleProcessorTest, DependencyImportsCanBeSkipped) {
        fs_->add_file("/p/b.js", "import './c';\n");

        const auto processor = make({.extract_dependency_imports = false, .retain_dependency_content = false});
        const ProcessedModule module = processor.process("/p/b.js", false);

        ASSERT_EQ(module.records.size(), 1u);
        EXPECT_TRUE(module.records[0].value().record->requests.empty());
        EXPECT_TRUE(module.records[0].value().requests.empty());
    }

    TEST_F(ModuleProcessorTest, UnsupportedExtension) {
        fs_->add_file("/p/style.css", "body {}");

        const auto processor = make();
        const ProcessedModule module = processor.process("/p/style.css", true);

        EXPECT_FALSE(module.supported);
        EXPECT_TRUE(module.records.empty());
        EXPECT_FALSE(module.failed());
        EXPECT_EQ(fs_->read_count("/p/style.css"), 0u);
    }

    TEST_F(ModuleProcessorTest, ReadFailureIsDiagnostic) {
        const auto processor = make();
        const ProcessedModule module = processor.process("/p/missing.js", true);

        EXPECT_TRUE(module.failed());
        ASSERT_EQ(module.records.size(), 1u);
        const auto& diagnostics = module.records[0].error();
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].code, "io");
        EXPECT_EQ(diagnostics[0].path, fs::path("/p/missing.js"));
        EXPECT_EQ(diagnostics[0].severity, Severity::Error);
    }

    TEST_F(ModuleProcessorTest, UnresolvedImportIsKept) {
        fs_->add_file("/p/a.js", "import './missing';\n");

        const auto processor = make();
        const ProcessedModule module = processor.process("/p/a.js", true);

        const auto& requests = module.records[0].value().requests;
        ASSERT_EQ(requests.size(), 1u);
        ASSERT_TRUE(requests[0].resolved.is_err());
        EXPECT_EQ(requests[0].resolved.error().code(), ErrorCode::ResolveError);
    }

    TEST_F(ModuleProcessorTest, CompositeSegmentsAreIndependent) {
        const std::string source =
            "<template><div/></template>\n"
            "<script>\nconst a = (1;\n</script>\n"
            "<script setup>\nimport B from './B.vue';\ndebugger;\n</script>\n";
        fs_->add_file("/p/A.vue", source);
        fs_->add_file("/p/B.vue", "<script>export default {}</script>");

        const auto processor = make();
        const ProcessedModule module = processor.process("/p/A.vue", true);

        EXPECT_TRUE(module.composite);
        ASSERT_EQ(module.records.size(), 2u);

        ASSERT_TRUE(module.records[0].is_err());
        const auto& parse_errors = module.records[0].error();
        ASSERT_FALSE(parse_errors.empty());
        EXPECT_EQ(parse_errors[0].segment, std::optional<std::size_t>(0));
        ASSERT_TRUE(parse_errors[0].span.has_value());
        EXPECT_GE(parse_errors[0].span->start, source.find("const"));

        ASSERT_TRUE(module.records[1].is_ok());
        const auto& second = module.records[1].value();
        EXPECT_EQ(second.record->segment, 1u);
        ASSERT_EQ(second.record->requests.size(), 1u);
        EXPECT_EQ(second.record->requests[0].span.start, source.find("'./B.vue'"));
        ASSERT_EQ(second.requests.size(), 1u);
        EXPECT_TRUE(second.requests[0].resolved.is_ok());

        ASSERT_TRUE(module.content.has_value());
        ASSERT_EQ(module.content->segments.size(), 2u);
        EXPECT_EQ(module.content->segments[0].tree, nullptr);
        EXPECT_NE(module.content->segments[1].tree, nullptr);
    }

    TEST_F(ModuleProcessorTest, NoResolverMeansNoRequests) {
        fs_->add_file("/p/a.js", "import './b';\n");
        const ModuleProcessor processor(fs_, loaders_, nullptr, *pool_);

        const ProcessedModule module = processor.process("/p/a.js", true);
        ASSERT_EQ(module.records.size(), 1u);
        EXPECT_EQ(module.records[0].value().record->requests.size(), 1u);
        EXPECT_TRUE(module.records[0].value().requests.empty());
    }
}
