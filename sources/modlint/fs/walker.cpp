#include "modlint/fs/walker.hpp"
#include "modlint/utils/path_utils.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>

namespace modlint::fsys {

    namespace {

        bool is_regex_special(const char c) {
            switch (c) {
                case '\\': case '^': case '$': case '.': case '|':
                case '?': case '*': case '+': case '(': case ')':
                case '[': case ']': case '{': case '}':
                    return true;
                default:
                    return false;
            }
        }

        void append_literal(std::string& rx, const char c) {
            if (is_regex_special(c)) {
                rx += '\\';
            }
            rx += c;
        }

        bool skipped_directory(const fs::path& dir) {
            const std::string name = dir.filename().string();
            return name == "node_modules" || (name.size() > 1 && name.front() == '.');
        }

    }  // namespace

    std::string glob_to_regex(const std::string_view glob) {
        std::string rx;
        rx.reserve(glob.size() * 2);

        for (std::size_t i = 0; i < glob.size(); ++i) {
            const char c = glob[i];
            switch (c) {
                case '*':
                    if (i + 1 < glob.size() && glob[i + 1] == '*') {
                        if (i + 2 < glob.size() && glob[i + 2] == '/') {
                            rx += "(?:.*/)?";
                            i += 2;
                        } else {
                            rx += ".*";
                            i += 1;
                        }
                    } else {
                        rx += "[^/]*";
                    }
                    break;
                case '?':
                    rx += "[^/]";
                    break;
                case '[': {
                    const std::size_t close = glob.find(']', i + 1);
                    if (close == std::string_view::npos) {
                        rx += "\\[";
                        break;
                    }
                    rx += '[';
                    std::size_t j = i + 1;
                    if (j < close && (glob[j] == '!' || glob[j] == '^')) {
                        rx += '^';
                        ++j;
                    }
                    for (; j < close; ++j) {
                        if (glob[j] == '\\' || glob[j] == '[') {
                            rx += '\\';
                        }
                        rx += glob[j];
                    }
                    rx += ']';
                    i = close;
                    break;
                }
                case '\\':
                    if (i + 1 < glob.size()) {
                        append_literal(rx, glob[++i]);
                    } else {
                        rx += "\\\\";
                    }
                    break;
                default:
                    append_literal(rx, c);
            }
        }

        return rx;
    }

    // ============================================================================
    // IgnoreMatcher
    // ============================================================================

    Result<void, Error> IgnoreMatcher::add(const std::string_view pattern, const fs::path& base) {
        std::string text(pattern);
        while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) {
            if (text.back() == ' ' && text.size() >= 2 && text[text.size() - 2] == '\\') {
                break;
            }
            text.pop_back();
        }
        if (text.empty() || text.front() == '#') {
            return Result<void, Error>::success();
        }

        Rule rule;
        rule.pattern = text;
        rule.base = path_utils::normalize(base);

        if (text.front() == '!') {
            rule.negated = true;
            text.erase(0, 1);
        } else if (text.starts_with("\\!") || text.starts_with("\\#")) {
            text.erase(0, 1);
        }
        if (!text.empty() && text.back() == '/') {
            rule.directory_only = true;
            text.pop_back();
        }
        if (!text.empty() && text.front() == '/') {
            rule.anchored = true;
            text.erase(0, 1);
        }
        if (text.find('/') != std::string::npos) {
            rule.anchored = true;
        }
        if (text.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Empty ignore pattern", rule.pattern)
            );
        }

        try {
            rule.regex = std::regex(glob_to_regex(text), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return Result<void, Error>::failure(
                Error::config_error("Invalid ignore pattern '" + rule.pattern + "'", e.what())
            );
        }

        rules_.push_back(std::move(rule));
        return Result<void, Error>::success();
    }

    Result<void, Error> IgnoreMatcher::add_file(const fs::path& file) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec)) {
            return Result<void, Error>::failure(
                Error::not_found("Ignore file not found", file.string())
            );
        }

        std::ifstream in(file);
        if (!in) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open ignore file", file.string())
            );
        }

        const fs::path base = path_utils::normalize(fs::absolute(file, ec).parent_path());
        std::string line;
        std::size_t number = 0;
        while (std::getline(in, line)) {
            ++number;
            if (auto added = add(line, base); added.is_err()) {
                return Result<void, Error>::failure(
                    added.error().with_context(file.string() + ":" + std::to_string(number))
                );
            }
        }

        return Result<void, Error>::success();
    }

    bool IgnoreMatcher::decide(const fs::path& candidate, const bool is_directory) const {
        bool ignored = false;

        for (const auto& rule : rules_) {
            if (rule.directory_only && !is_directory) {
                continue;
            }

            const fs::path rel = candidate.lexically_relative(rule.base);
            if (rel.empty() || rel == "." || *rel.begin() == "..") {
                continue;
            }

            const std::string subject = rule.anchored
                ? rel.generic_string()
                : candidate.filename().generic_string();
            if (std::regex_match(subject, rule.regex)) {
                ignored = !rule.negated;
            }
        }

        return ignored;
    }

    bool IgnoreMatcher::is_ignored(const fs::path& path, const bool is_directory) const {
        if (rules_.empty()) {
            return false;
        }

        const fs::path target = path_utils::normalize(path);
        std::vector<fs::path> prefixes;
        fs::path prefix;
        for (const auto& component : target) {
            prefix /= component;
            prefixes.push_back(prefix);
        }

        // parents first: nothing inside an ignored directory comes back
        for (std::size_t i = 0; i < prefixes.size(); ++i) {
            const bool last = i + 1 == prefixes.size();
            if (decide(prefixes[i], last ? is_directory : true)) {
                return true;
            }
        }
        return false;
    }

    // ============================================================================
    // collect_paths
    // ============================================================================

    Result<std::vector<fs::path>, Error> collect_paths(
        const std::vector<fs::path>& inputs,
        const fs::path& cwd,
        IgnoreMatcher ignore,
        const std::function<bool(const fs::path&)>& accept,
        const WalkOptions& options
    ) {
        using R = Result<std::vector<fs::path>, Error>;

        std::vector<fs::path> files;
        std::set<fs::path> seen;
        std::set<fs::path> loaded;

        const auto load_ignore_file = [&](const fs::path& dir) -> Result<void, Error> {
            if (options.ignore_file_name.empty()) {
                return Result<void, Error>::success();
            }
            const fs::path file = dir / options.ignore_file_name;
            std::error_code ec;
            if (!fs::is_regular_file(file, ec) || !loaded.insert(file).second) {
                return Result<void, Error>::success();
            }
            return ignore.add_file(file);
        };

        // the working directory's ignore file also covers explicit files
        if (auto r = load_ignore_file(path_utils::normalize(cwd)); r.is_err()) {
            return R::failure(r.error());
        }

        for (const auto& input : inputs) {
            const fs::path root = path_utils::absolute_from(input, cwd);
            std::error_code ec;

            if (fs::is_regular_file(root, ec)) {
                if (!ignore.is_ignored(root, false) && seen.insert(root).second) {
                    files.push_back(root);
                }
                continue;
            }
            if (!fs::is_directory(root, ec)) {
                return R::failure(Error::not_found("No such file or directory", input.string()));
            }
            if (ignore.is_ignored(root, true)) {
                continue;
            }
            if (auto r = load_ignore_file(root); r.is_err()) {
                return R::failure(r.error());
            }

            std::vector<fs::path> found;
            auto it = fs::recursive_directory_iterator(
                root, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                return R::failure(Error::io_error("Cannot read directory " + input.string(), ec.message()));
            }
            for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
                if (ec) {
                    return R::failure(Error::io_error("Cannot read directory " + input.string(), ec.message()));
                }

                const fs::path& path = it->path();
                if (it->is_directory(ec)) {
                    if ((options.skip_hidden && skipped_directory(path)) || ignore.is_ignored(path, true)) {
                        it.disable_recursion_pending();
                        continue;
                    }
                    if (auto r = load_ignore_file(path); r.is_err()) {
                        return R::failure(r.error());
                    }
                    continue;
                }

                if (it->is_regular_file(ec) && accept(path) && !ignore.is_ignored(path, false)) {
                    found.push_back(path);
                }
            }

            std::sort(found.begin(), found.end());
            for (auto& f : found) {
                if (seen.insert(f).second) {
                    files.push_back(std::move(f));
                }
            }
        }

        return R::success(std::move(files));
    }

}  // namespace modlint::fsys
