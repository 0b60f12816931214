#include "modlint/resolver/resolver.hpp"
#include "modlint/utils/path_utils.hpp"

namespace modlint::resolver {

    RelativeResolver::RelativeResolver(
        std::shared_ptr<const fsys::IFileSystem> file_system,
        RelativeResolverOptions options
    )
        : fs_(std::move(file_system))
        , options_(std::move(options)) {}

    bool RelativeResolver::handles(const std::string_view specifier) const {
        if (specifier.empty()) {
            return false;
        }
        return options_.report_bare_specifiers || path_utils::is_path_specifier(specifier);
    }

    Result<fs::path, Error> RelativeResolver::resolve(
        const fs::path& base_dir,
        const std::string_view specifier
    ) const {
        if (!path_utils::is_path_specifier(specifier)) {
            return Result<fs::path, Error>::failure(
                Error::resolve_error("Cannot resolve package '" + std::string(specifier) + "'", base_dir.string())
            );
        }

        const fs::path candidate = path_utils::absolute_from(fs::path(std::string(specifier)), base_dir);

        if (fs_->is_file(candidate)) {
            return Result<fs::path, Error>::success(candidate);
        }

        for (const auto& ext : options_.extensions) {
            fs::path with_ext = candidate;
            with_ext += ext;
            if (fs_->is_file(with_ext)) {
                return Result<fs::path, Error>::success(std::move(with_ext));
            }
        }

        for (const auto& ext : options_.extensions) {
            const fs::path index = candidate / ("index" + ext);
            if (fs_->is_file(index)) {
                return Result<fs::path, Error>::success(index);
            }
        }

        return Result<fs::path, Error>::failure(
            Error::resolve_error("Cannot find module '" + std::string(specifier) + "'", base_dir.string())
        );
    }

}  // namespace modlint::resolver
