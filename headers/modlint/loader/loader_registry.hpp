#ifndef MODLINT_LOADER_REGISTRY_HPP
#define MODLINT_LOADER_REGISTRY_HPP

/**
 * @file loader_registry.hpp
 * @brief Extension -> (splitter, parser) lookup.
 *
 * A path whose extension is not registered is not linted: the processor
 * returns an empty result for it.
 */

#include "modlint/loader/parser.hpp"
#include "modlint/loader/splitter.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modlint::loader {

    struct Loader {
        std::shared_ptr<const ISourceSplitter> splitter;
        std::shared_ptr<const IParser> parser;
    };

    class LoaderRegistry {
    public:
        LoaderRegistry() = default;

        /**
         * Registry for script files (.js .mjs .cjs .jsx .ts .mts .cts .tsx)
         * and composite files (.vue .svelte .astro .html).
         */
        [[nodiscard]] static LoaderRegistry with_defaults();

        /**
         * Registers or replaces the loader for extension (with leading dot).
         */
        void register_loader(const std::string& extension, Loader loader);

        [[nodiscard]] const Loader* find(std::string_view extension) const;

        [[nodiscard]] bool supports(const std::string_view extension) const {
            return find(extension) != nullptr;
        }

        [[nodiscard]] std::vector<std::string> extensions() const;

        /**
         * Keeps only the listed extensions.
         */
        void retain(const std::vector<std::string>& extensions);

    private:
        std::map<std::string, Loader, std::less<>> loaders_;
    };

}  // namespace modlint::loader

#endif // MODLINT_LOADER_REGISTRY_HPP
