#include "modlint/loader/loader_registry.hpp"

#include <algorithm>

namespace modlint::loader {

    LoaderRegistry LoaderRegistry::with_defaults() {
        LoaderRegistry registry;

        auto parser = std::make_shared<const ScriptParser>();
        auto plain = std::make_shared<const PlainSplitter>();
        auto composite = std::make_shared<const CompositeSplitter>();

        for (const char* ext : {".js", ".mjs", ".cjs", ".jsx", ".ts", ".mts", ".cts", ".tsx"}) {
            registry.register_loader(ext, Loader{plain, parser});
        }
        for (const char* ext : {".vue", ".svelte", ".astro", ".html"}) {
            registry.register_loader(ext, Loader{composite, parser});
        }

        return registry;
    }

    void LoaderRegistry::register_loader(const std::string& extension, Loader loader) {
        loaders_[extension] = std::move(loader);
    }

    const Loader* LoaderRegistry::find(const std::string_view extension) const {
        const auto it = loaders_.find(extension);
        return it == loaders_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> LoaderRegistry::extensions() const {
        std::vector<std::string> result;
        result.reserve(loaders_.size());
        for (const auto& [ext, loader] : loaders_) {
            result.push_back(ext);
        }
        return result;
    }

    void LoaderRegistry::retain(const std::vector<std::string>& extensions) {
        std::erase_if(loaders_, [&](const auto& entry) {
            return std::find(extensions.begin(), extensions.end(), entry.first) == extensions.end();
        });
    }

}  // namespace modlint::loader
