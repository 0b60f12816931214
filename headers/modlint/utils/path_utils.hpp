#ifndef MODLINT_PATH_UTILS_HPP
#define MODLINT_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Lexical path helpers.
 *
 * All helpers work on fs::path values without touching the file system, so
 * they are safe for paths that do not exist and for paths whose bytes are
 * not valid UTF-8.
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace modlint::path_utils {

    namespace fs = std::filesystem;

    /**
     * Resolves "." and ".." components lexically.
     *
     * Unlike fs::canonical(), symlinks are left alone and the path need not
     * exist.
     */
    inline fs::path normalize(const fs::path& path) {
        fs::path result;

        for (const auto& component : path) {
            if (component == ".") {
                continue;
            }
            if (component == "..") {
                if (!result.empty() && result.filename() != ".." && result != result.root_path()) {
                    result = result.parent_path();
                } else if (result != result.root_path() || result.empty()) {
                    result /= component;
                }
            } else {
                result /= component;
            }
        }

        return result.empty() ? fs::path(".") : result;
    }

    /**
     * Makes path absolute against base (when relative) and normalizes it.
     */
    inline fs::path absolute_from(const fs::path& path, const fs::path& base) {
        return normalize(path.is_absolute() ? path : base / path);
    }

    /**
     * Makes a path relative to base for display; returns path unchanged when
     * that is not possible.
     */
    inline fs::path make_relative(const fs::path& path, const fs::path& base) {
        std::error_code ec;
        auto result = fs::relative(path, base, ec);

        if (ec || result.empty()) {
            return path;
        }

        return result;
    }

    /**
     * Number of directory components above the file name.
     *
     * "/a/b/c.js" has depth 2; "c.js" has depth 0. The root is not counted.
     */
    inline std::size_t directory_depth(const fs::path& path) {
        std::size_t count = 0;
        for (const auto& component : path.relative_path().parent_path()) {
            if (!component.empty() && component != ".") {
                ++count;
            }
        }
        return count;
    }

    /**
     * Extension including the leading dot, as a narrow string.
     */
    inline std::string extension_of(const fs::path& path) {
        return path.extension().string();
    }

    /**
     * True for "./x", "../x" and absolute specifiers.
     */
    inline bool is_path_specifier(std::string_view specifier) {
        return specifier.starts_with("./") || specifier.starts_with("../") ||
               specifier == "." || specifier == ".." || specifier.starts_with("/");
    }

}  // namespace modlint::path_utils

#endif // MODLINT_PATH_UTILS_HPP
