#ifndef MODLINT_RESOLVER_HPP
#define MODLINT_RESOLVER_HPP

/**
 * @file resolver.hpp
 * @brief Import specifier -> file path resolution.
 *
 * Resolution failure is never fatal: the processor records the error on the
 * request and the analysis pass reports it on the importing file.
 */

#include "modlint/fs/file_system.hpp"
#include "modlint/result.hpp"
#include "modlint/error.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modlint::resolver {

    namespace fs = std::filesystem;

    class IDependencyResolver {
    public:
        virtual ~IDependencyResolver() = default;

        /**
         * Whether this resolver is responsible for specifier at all.
         *
         * Specifiers it does not handle produce no edge and no diagnostic.
         */
        [[nodiscard]] virtual bool handles(std::string_view specifier) const = 0;

        /**
         * Resolves specifier relative to the importing file's directory.
         */
        [[nodiscard]] virtual Result<fs::path, Error> resolve(
            const fs::path& base_dir,
            std::string_view specifier
        ) const = 0;
    };

    struct RelativeResolverOptions {
        /**
         * Extensions tried, in order, when the specifier names no existing
         * file, and for "<dir>/index<ext>".
         */
        std::vector<std::string> extensions = {
            ".js", ".mjs", ".cjs", ".jsx", ".ts", ".mts", ".cts", ".tsx",
            ".vue", ".svelte", ".astro"
        };

        /**
         * Treat package specifiers ("react", "@scope/pkg") as unresolvable
         * instead of ignoring them.
         */
        bool report_bare_specifiers = false;
    };

    /**
     * Resolves "./", "../" and absolute specifiers against the file system.
     *
     * Lookup order for "./x": x, x<ext> for each extension, x/index<ext>.
     */
    class RelativeResolver final : public IDependencyResolver {
    public:
        explicit RelativeResolver(
            std::shared_ptr<const fsys::IFileSystem> file_system,
            RelativeResolverOptions options = {}
        );

        [[nodiscard]] bool handles(std::string_view specifier) const override;

        [[nodiscard]] Result<fs::path, Error> resolve(
            const fs::path& base_dir,
            std::string_view specifier
        ) const override;

    private:
        std::shared_ptr<const fsys::IFileSystem> fs_;
        RelativeResolverOptions options_;
    };

}  // namespace modlint::resolver

#endif // MODLINT_RESOLVER_HPP
