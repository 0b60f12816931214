#ifndef MODLINT_CONFIG_HPP
#define MODLINT_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Project configuration read from .modlintrc.json.
 *
 * @code
 *     {
 *       "rules": { "no-debugger": "error", "import/no-cycle": "warn" },
 *       "extensions": [".js", ".ts", ".vue"],
 *       "batch_multiplier": 4,
 *       "fix": false,
 *       "ignorePatterns": ["dist/", "*.min.js"]
 *     }
 * @endcode
 *
 * Every key is optional. Rules not listed keep their default severity.
 * Ignore patterns use gitignore syntax and are relative to the directory
 * holding the configuration file.
 */

#include "modlint/result.hpp"
#include "modlint/error.hpp"
#include "modlint/rules/rule.hpp"
#include "modlint/types.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modlint::config {

    namespace fs = std::filesystem;

    inline constexpr const char* CONFIG_FILE_NAME = ".modlintrc.json";

    struct LintConfig {
        std::map<std::string, Severity, std::less<>> rules;

        /**
         * Extensions to lint (with leading dot); empty keeps all registered.
         */
        std::vector<std::string> extensions;

        std::optional<std::size_t> batch_multiplier;
        std::optional<bool> fix;

        std::vector<std::string> ignore_patterns;
    };

    /**
     * Parses "off", "warn" / "warning" and "error".
     */
    [[nodiscard]] Result<Severity, Error> parse_severity(std::string_view text);

    [[nodiscard]] Result<LintConfig, Error> parse_config(std::string_view text);

    [[nodiscard]] Result<LintConfig, Error> load_config(const fs::path& path);

    /**
     * Looks for CONFIG_FILE_NAME in start and its parents.
     */
    [[nodiscard]] std::optional<fs::path> find_config(const fs::path& start);

    /**
     * Default rule set of registry with the severities of config applied.
     * Unknown rule names are a ConfigError.
     */
    [[nodiscard]] Result<rules::RuleSet, Error> build_rule_set(
        const LintConfig& config,
        const rules::RuleRegistry& registry
    );

}  // namespace modlint::config

#endif // MODLINT_CONFIG_HPP
