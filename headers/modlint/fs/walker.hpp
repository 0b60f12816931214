#ifndef MODLINT_WALKER_HPP
#define MODLINT_WALKER_HPP

/**
 * @file walker.hpp
 * @brief Expands command-line inputs into the files to lint.
 *
 * Directories are walked recursively; files named explicitly are kept as
 * given. Both are filtered through an IgnoreMatcher built from the
 * configuration's ignore patterns, --ignore-pattern options and ignore
 * files (.gitignore by default, read in every walked directory).
 *
 * @code
 *     IgnoreMatcher ignore;
 *     ignore.add("dist/", cwd);
 *     ignore.add("*.min.js", cwd);
 *     auto files = collect_paths({"src"}, cwd, ignore, is_lintable);
 * @endcode
 */

#include "modlint/result.hpp"
#include "modlint/error.hpp"

#include <filesystem>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace modlint::fsys {

    namespace fs = std::filesystem;

    /**
     * Gitignore-style pattern set.
     *
     * Pattern syntax:
     * - blank lines and lines starting with '#' are skipped
     * - a leading '!' re-includes what an earlier pattern excluded
     * - a trailing '/' matches directories only
     * - a pattern with a '/' before its end is anchored to its base
     *   directory; otherwise it matches a name at any depth
     * - '*' and '?' stay inside one path component, '**' crosses them
     *
     * The last pattern that matches decides. A path inside an ignored
     * directory is ignored whatever later patterns say about the path itself.
     */
    class IgnoreMatcher {
    public:
        /**
         * Adds one pattern, interpreted relative to base (an absolute
         * directory). A pattern that is not valid glob syntax is a
         * ConfigError; blank and comment lines are accepted and ignored.
         */
        [[nodiscard]] Result<void, Error> add(std::string_view pattern, const fs::path& base);

        /**
         * Adds every line of an ignore file, relative to the file's
         * directory. A missing file is NotFound.
         */
        [[nodiscard]] Result<void, Error> add_file(const fs::path& file);

        /**
         * True if path (absolute) or one of its parent directories is ignored.
         */
        [[nodiscard]] bool is_ignored(const fs::path& path, bool is_directory) const;

        [[nodiscard]] std::size_t size() const noexcept {
            return rules_.size();
        }

    private:
        struct Rule {
            std::string pattern;
            fs::path base;
            std::regex regex;
            bool negated = false;
            bool directory_only = false;
            bool anchored = false;
        };

        /**
         * Verdict of the rules for one candidate: true ignored, false
         * re-included or unmatched.
         */
        [[nodiscard]] bool decide(const fs::path& candidate, bool is_directory) const;

        std::vector<Rule> rules_;
    };

    struct WalkOptions {
        /**
         * File name of the per-directory ignore files; empty reads none.
         */
        std::string ignore_file_name = ".gitignore";

        /**
         * Skip node_modules and directories whose name starts with '.'.
         */
        bool skip_hidden = true;
    };

    /**
     * Collects lintable files below inputs.
     *
     * Relative inputs are taken against cwd. A walked file is kept when
     * accept() returns true for it; explicitly named files skip that check.
     * Every file, walked or named, is dropped when ignore matches it.
     * Results are absolute, deduplicated, and sorted within each input.
     *
     * A missing input is NotFound; an unreadable directory is IoError.
     */
    [[nodiscard]] Result<std::vector<fs::path>, Error> collect_paths(
        const std::vector<fs::path>& inputs,
        const fs::path& cwd,
        IgnoreMatcher ignore,
        const std::function<bool(const fs::path&)>& accept,
        const WalkOptions& options = {}
    );

    /**
     * Translates one glob (already stripped of '!', leading '/' and trailing
     * '/') to an ECMAScript regex matched against '/'-separated paths.
     */
    [[nodiscard]] std::string glob_to_regex(std::string_view glob);

}  // namespace modlint::fsys

#endif // MODLINT_WALKER_HPP
