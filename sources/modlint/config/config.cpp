#include "modlint/config/config.hpp"
#include "modlint/utils/json_utils.hpp"

#include <system_error>

namespace modlint::config {

    using json_utils::json;

    Result<Severity, Error> parse_severity(const std::string_view text) {
        if (text == "off") {
            return Result<Severity, Error>::success(Severity::Off);
        }
        if (text == "warn" || text == "warning") {
            return Result<Severity, Error>::success(Severity::Warning);
        }
        if (text == "error") {
            return Result<Severity, Error>::success(Severity::Error);
        }
        return Result<Severity, Error>::failure(
            Error::config_error("Invalid severity '" + std::string(text) + "'", "expected off, warn or error")
        );
    }

    namespace {

        Result<void, Error> read_rules(const json& node, LintConfig& config) {
            if (!node.is_object()) {
                return Result<void, Error>::failure(Error::config_error("'rules' must be an object"));
            }
            for (const auto& [name, value] : node.items()) {
                if (!value.is_string()) {
                    return Result<void, Error>::failure(
                        Error::config_error("Severity of rule '" + name + "' must be a string")
                    );
                }
                auto severity = parse_severity(value.get<std::string>());
                if (severity.is_err()) {
                    return Result<void, Error>::failure(severity.error().with_context("rule " + name));
                }
                config.rules[name] = severity.value();
            }
            return Result<void, Error>::success();
        }

        Result<void, Error> read_extensions(const json& node, LintConfig& config) {
            if (!node.is_array()) {
                return Result<void, Error>::failure(Error::config_error("'extensions' must be an array"));
            }
            for (const auto& item : node) {
                if (!item.is_string()) {
                    return Result<void, Error>::failure(Error::config_error("Extensions must be strings"));
                }
                std::string ext = item.get<std::string>();
                if (ext.empty()) {
                    return Result<void, Error>::failure(Error::config_error("Empty extension"));
                }
                if (ext.front() != '.') {
                    ext.insert(ext.begin(), '.');
                }
                config.extensions.push_back(std::move(ext));
            }
            return Result<void, Error>::success();
        }

        Result<void, Error> read_ignore_patterns(const json& node, LintConfig& config) {
            if (!node.is_array()) {
                return Result<void, Error>::failure(Error::config_error("'ignorePatterns' must be an array"));
            }
            for (const auto& item : node) {
                if (!item.is_string()) {
                    return Result<void, Error>::failure(Error::config_error("Ignore patterns must be strings"));
                }
                config.ignore_patterns.push_back(item.get<std::string>());
            }
            return Result<void, Error>::success();
        }

        Result<LintConfig, Error> config_from_json(const json& root) {
            if (!root.is_object()) {
                return Result<LintConfig, Error>::failure(Error::config_error("Configuration must be a JSON object"));
            }

            LintConfig config;

            if (root.contains("rules")) {
                if (auto r = read_rules(root.at("rules"), config); r.is_err()) {
                    return Result<LintConfig, Error>::failure(r.error());
                }
            }

            if (root.contains("extensions")) {
                if (auto r = read_extensions(root.at("extensions"), config); r.is_err()) {
                    return Result<LintConfig, Error>::failure(r.error());
                }
            }

            if (root.contains("ignorePatterns")) {
                if (auto r = read_ignore_patterns(root.at("ignorePatterns"), config); r.is_err()) {
                    return Result<LintConfig, Error>::failure(r.error());
                }
            }

            if (root.contains("batch_multiplier")) {
                const json& k = root.at("batch_multiplier");
                if (!k.is_number_unsigned() || k.get<std::size_t>() == 0) {
                    return Result<LintConfig, Error>::failure(
                        Error::config_error("'batch_multiplier' must be a positive integer")
                    );
                }
                config.batch_multiplier = k.get<std::size_t>();
            }

            if (root.contains("fix")) {
                auto fix = json_utils::get<bool>(root, "fix");
                if (fix.is_err()) {
                    return Result<LintConfig, Error>::failure(
                        Error::config_error("'fix' must be a boolean", fix.error().context().value_or(""))
                    );
                }
                config.fix = fix.value();
            }

            return Result<LintConfig, Error>::success(std::move(config));
        }

    }  // namespace

    Result<LintConfig, Error> parse_config(const std::string_view text) {
        auto parsed = json_utils::parse(text);
        if (parsed.is_err()) {
            return Result<LintConfig, Error>::failure(
                Error::config_error("Invalid configuration: " + parsed.error().message(),
                                    parsed.error().context().value_or(""))
            );
        }
        return config_from_json(parsed.value());
    }

    Result<LintConfig, Error> load_config(const fs::path& path) {
        auto data = json_utils::read_file(path);
        if (data.is_err()) {
            if (data.error().code() == ErrorCode::NotFound) {
                return Result<LintConfig, Error>::failure(
                    Error::config_error("Configuration file not found", path.string())
                );
            }
            return Result<LintConfig, Error>::failure(
                Error::config_error("Invalid configuration: " + data.error().message(),
                                    data.error().context().value_or(path.string()))
            );
        }

        auto config = config_from_json(data.value());
        if (config.is_err()) {
            return Result<LintConfig, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    std::optional<fs::path> find_config(const fs::path& start) {
        std::error_code ec;
        fs::path dir = fs::absolute(start, ec);
        if (ec) {
            return std::nullopt;
        }
        if (fs::is_regular_file(dir, ec)) {
            dir = dir.parent_path();
        }

        while (true) {
            fs::path candidate = dir / CONFIG_FILE_NAME;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
            if (dir == dir.root_path() || dir.parent_path() == dir) {
                return std::nullopt;
            }
            dir = dir.parent_path();
        }
    }

    Result<rules::RuleSet, Error> build_rule_set(
        const LintConfig& config,
        const rules::RuleRegistry& registry
    ) {
        for (const auto& [name, severity] : config.rules) {
            if (registry.get_rule(name) == nullptr) {
                return Result<rules::RuleSet, Error>::failure(
                    Error::config_error("Unknown rule '" + name + "'")
                );
            }
        }

        rules::RuleSet set = rules::default_rule_set(registry);
        for (auto& configured : set) {
            if (const auto it = config.rules.find(configured.rule->name()); it != config.rules.end()) {
                configured.severity = it->second;
            }
        }
        return Result<rules::RuleSet, Error>::success(std::move(set));
    }

}  // namespace modlint::config
