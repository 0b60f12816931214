#include "modlint/runtime/module_processor.hpp"
#include "modlint/log.hpp"
#include "modlint/utils/path_utils.hpp"

#include <set>

namespace modlint::runtime {

    namespace {

        Diagnostic io_diagnostic(const fs::path& path, const Error& error) {
            Diagnostic d;
            d.path = path;
            d.severity = Severity::Error;
            d.code = std::string(codes::io);
            d.message = error.message();
            return d;
        }

        Diagnostics attach(Diagnostics diagnostics, const fs::path& path, std::optional<std::size_t> segment) {
            for (auto& d : diagnostics) {
                d.path = path;
                if (segment) {
                    d.segment = segment;
                }
            }
            return diagnostics;
        }

    }  // namespace

    ModuleProcessor::ModuleProcessor(
        std::shared_ptr<const fsys::IFileSystem> file_system,
        std::shared_ptr<const loader::LoaderRegistry> loaders,
        std::shared_ptr<const resolver::IDependencyResolver> resolver,
        memory::ArenaPool& arenas,
        const ProcessorOptions options
    )
        : fs_(std::move(file_system))
        , loaders_(std::move(loaders))
        , resolver_(std::move(resolver))
        , arenas_(arenas)
        , options_(options) {}

    ProcessedModule ModuleProcessor::process(const fs::path& path, const bool is_entry) const {
        ProcessedModule module;
        module.path = path;
        module.is_entry = is_entry;

        const bool keep_content = is_entry || options_.retain_dependency_content;
        const std::string extension = path_utils::extension_of(path);

        const loader::Loader* loader = loaders_->find(extension);
        if (loader == nullptr) {
            module.supported = false;
            if (keep_content) {
                module.content.emplace(Content{arenas_.acquire(), {}, {}});
            }
            return module;
        }

        memory::ArenaLease lease = arenas_.acquire();

        auto text = fs_->read_to_arena(path, *lease);
        if (text.is_err()) {
            log::logger()->debug("read failed for {}: {}", path.string(), text.error().message());
            module.records.push_back(SegmentResult::failure(Diagnostics{io_diagnostic(path, text.error())}));
            if (keep_content) {
                module.content.emplace(Content{std::move(lease), {}, {}});
            }
            return module;
        }
        const std::string_view source = text.value();

        auto split = loader->splitter->split(source, extension);
        if (split.is_err()) {
            module.records.push_back(SegmentResult::failure(attach(std::move(split).error(), path, std::nullopt)));
            if (keep_content) {
                module.content.emplace(Content{std::move(lease), source, {}});
            }
            return module;
        }

        const auto& segments = split.value();
        module.composite = !(segments.size() == 1 && segments.front().offset == 0 &&
                             segments.front().text.size() == source.size());

        std::vector<SegmentContent> contents;
        contents.reserve(segments.size());

        for (std::size_t i = 0; i < segments.size(); ++i) {
            const auto& segment = segments[i];
            const std::optional<std::size_t> segment_index =
                module.composite ? std::optional<std::size_t>(i) : std::nullopt;

            auto parsed = loader->parser->parse(*lease, segment);
            if (parsed.is_err()) {
                module.records.push_back(SegmentResult::failure(
                    attach(std::move(parsed).error(), path, segment_index)
                ));
                contents.push_back(SegmentContent{segment, nullptr, nullptr});
                continue;
            }

            const loader::StructuralTree* tree = parsed.value();

            ResolvedModuleRecord resolved;
            resolved.record = build_record(
                path, i, segment, *tree, is_entry || options_.extract_dependency_imports
            );
            if (resolver_) {
                resolved.requests = resolve_requests(path, *resolved.record);
            }
            module.records.push_back(SegmentResult::success(std::move(resolved)));

            const loader::SemanticModel* semantic =
                keep_content ? loader::SemanticBuilder::build(*lease, *tree) : nullptr;
            contents.push_back(SegmentContent{segment, tree, semantic});
        }

        if (keep_content) {
            module.content.emplace(Content{std::move(lease), source, std::move(contents)});
        }

        return module;
    }

    std::shared_ptr<graph::ModuleRecord> ModuleProcessor::build_record(
        const fs::path& path,
        const std::size_t segment_index,
        const loader::Segment& segment,
        const loader::StructuralTree& tree,
        const bool extract
    ) const {
        auto record = std::make_shared<graph::ModuleRecord>();
        record->path = path;
        record->segment = segment_index;

        if (!extract) {
            return record;
        }

        for (const loader::Node* node : tree.body) {
            if (node->kind == loader::NodeKind::ImportDeclaration) {
                if (!node->has_source) continue;
                const std::string specifier(node->source);
                record->requests.push_back(graph::ModuleRequest{
                    specifier, graph::RequestKind::Import,
                    node->source_span.shifted(segment.offset), node->type_only
                });
                for (const auto& binding : node->bindings) {
                    record->imports.push_back(graph::ImportEntry{
                        specifier, std::string(binding.imported), std::string(binding.local),
                        binding.span.shifted(segment.offset), binding.type_only
                    });
                }
            } else if (node->kind == loader::NodeKind::ExportDeclaration) {
                if (node->has_source) {
                    record->requests.push_back(graph::ModuleRequest{
                        std::string(node->source), graph::RequestKind::ReExport,
                        node->source_span.shifted(segment.offset), node->type_only
                    });
                }
                for (const auto& binding : node->bindings) {
                    if (binding.imported == "*" && binding.local.empty()) {
                        record->has_star_reexport = true;
                        continue;
                    }
                    record->export_names.emplace_back(binding.imported);
                }
            }
        }

        return record;
    }

    std::vector<ResolvedModuleRequest> ModuleProcessor::resolve_requests(
        const fs::path& path,
        const graph::ModuleRecord& record
    ) const {
        std::vector<ResolvedModuleRequest> result;
        std::set<std::string, std::less<>> seen;
        const fs::path base_dir = path.parent_path();

        for (const auto& request : record.requests) {
            if (!resolver_->handles(request.specifier)) {
                continue;
            }
            if (!seen.insert(request.specifier).second) {
                continue;
            }
            result.push_back(ResolvedModuleRequest{
                request.specifier,
                request.span,
                resolver_->resolve(base_dir, request.specifier)
            });
        }

        return result;
    }

}  // namespace modlint::runtime
