#ifndef MODLINT_MODULE_PROCESSOR_HPP
#define MODLINT_MODULE_PROCESSOR_HPP

/**
 * @file module_processor.hpp
 * @brief Per-file worker step: read, split, parse, extract, resolve.
 *
 * process() runs on a pool worker inside an arena borrowed from the
 * ArenaPool. It never touches the module graph; everything it learns is
 * returned in a ProcessedModule that the coordinator consumes.
 *
 * Content (source text, trees, semantic models) is kept only for files that
 * will be analyzed: entry files, and every file when dependency content is
 * retained. For other files the arena goes back to the pool when process()
 * returns and only the heap-owned module records survive.
 */

#include "modlint/fs/file_system.hpp"
#include "modlint/graph/module_record.hpp"
#include "modlint/loader/loader_registry.hpp"
#include "modlint/loader/semantic.hpp"
#include "modlint/memory/arena_pool.hpp"
#include "modlint/resolver/resolver.hpp"
#include "modlint/result.hpp"
#include "modlint/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modlint::runtime {

    namespace fs = std::filesystem;

    /**
     * Outcome of resolving one distinct specifier of a segment.
     */
    struct ResolvedModuleRequest {
        std::string specifier;
        Span span;
        Result<fs::path, Error> resolved;
    };

    struct ResolvedModuleRecord {
        std::shared_ptr<graph::ModuleRecord> record;
        std::vector<ResolvedModuleRequest> requests;
    };

    using SegmentResult = Result<ResolvedModuleRecord, Diagnostics>;

    struct SegmentContent {
        loader::Segment segment;
        const loader::StructuralTree* tree = nullptr;      // null when parsing failed
        const loader::SemanticModel* semantic = nullptr;
    };

    /**
     * Arena-backed data of a module kept alive for analysis.
     *
     * The lease is declared first so it is destroyed last.
     */
    struct Content {
        memory::ArenaLease lease;
        std::string_view source_text;
        std::vector<SegmentContent> segments;
    };

    struct ProcessedModule {
        fs::path path;
        bool is_entry = false;
        bool supported = true;
        bool composite = false;
        std::vector<SegmentResult> records;
        std::optional<Content> content;

        [[nodiscard]] bool failed() const noexcept {
            for (const auto& r : records) {
                if (r.is_err()) return true;
            }
            return false;
        }
    };

    struct ProcessorOptions {
        /**
         * Build module records for dependency-only files too.
         */
        bool extract_dependency_imports = true;

        /**
         * Keep Content for dependency-only files (they are then analyzed).
         */
        bool retain_dependency_content = false;
    };

    class ModuleProcessor {
    public:
        /**
         * @param resolver May be null; no dependencies are discovered then.
         */
        ModuleProcessor(
            std::shared_ptr<const fsys::IFileSystem> file_system,
            std::shared_ptr<const loader::LoaderRegistry> loaders,
            std::shared_ptr<const resolver::IDependencyResolver> resolver,
            memory::ArenaPool& arenas,
            ProcessorOptions options = {}
        );

        [[nodiscard]] ProcessedModule process(const fs::path& path, bool is_entry) const;

        [[nodiscard]] const ProcessorOptions& options() const noexcept {
            return options_;
        }

    private:
        [[nodiscard]] std::shared_ptr<graph::ModuleRecord> build_record(
            const fs::path& path,
            std::size_t segment_index,
            const loader::Segment& segment,
            const loader::StructuralTree& tree,
            bool extract
        ) const;

        [[nodiscard]] std::vector<ResolvedModuleRequest> resolve_requests(
            const fs::path& path,
            const graph::ModuleRecord& record
        ) const;

        std::shared_ptr<const fsys::IFileSystem> fs_;
        std::shared_ptr<const loader::LoaderRegistry> loaders_;
        std::shared_ptr<const resolver::IDependencyResolver> resolver_;
        memory::ArenaPool& arenas_;
        ProcessorOptions options_;
    };

}  // namespace modlint::runtime

#endif // MODLINT_MODULE_PROCESSOR_HPP
