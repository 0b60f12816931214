#include "modlint/cli/commands/command.hpp"

#include "modlint/modlint.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace modlint::cli {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    namespace {

        json diagnostic_to_json(const Diagnostic& d, const fs::path& base) {
            json j;
            j["path"] = path_utils::make_relative(d.path, base).generic_string();
            j["segment"] = d.segment ? json(*d.segment) : json(nullptr);
            if (d.span) {
                j["span"] = {{"start", d.span->start}, {"end", d.span->end}};
            } else {
                j["span"] = nullptr;
            }
            j["severity"] = to_string(d.severity);
            j["code"] = d.code;
            j["message"] = d.message;
            j["help"] = d.help ? json(*d.help) : json(nullptr);
            return j;
        }

        json stats_to_json(const runtime::RunStatistics& s) {
            return {
                {"input_paths", s.input_paths},
                {"batches", s.batches},
                {"modules", s.modules},
                {"edges", s.edges},
                {"analyzed", s.analyzed},
                {"failed", s.failed},
                {"unsupported", s.unsupported},
                {"rule_failures", s.rule_failures},
                {"fixes_applied", s.fixes_applied},
                {"files_written", s.files_written},
                {"peak_retained_content", s.peak_retained_content},
                {"arenas_created", s.arenas_created}
            };
        }

    }  // namespace

    /**
     * Lint command - lints files and the modules they import.
     */
    class LintCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "lint";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Lint JavaScript, TypeScript and component files with their imports";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: modlint lint [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  modlint lint src/\n"
                   "  modlint lint --fix -j 8 src/app.ts src/components\n"
                   "  modlint lint --json --config ci/.modlintrc.json .\n"
                   "  modlint lint --ignore-pattern 'dist/' --max-warnings 10 .";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "Configuration file (default: nearest .modlintrc.json)", false, true, "", "FILE"},
                {"parallel", 'j', "Number of worker threads (0 = all cores)", false, true, "0", "N"},
                {"batch-multiplier", 'k', "Entry files per batch per worker", false, true, "", "K"},
                {"fix", 0, "Apply automatic fixes", false, false, "", ""},
                {"no-cross-module", 0, "Do not resolve imports or run graph rules", false, false, "", ""},
                {"lint-dependencies", 0, "Also report on imported files outside the inputs", false, false, "", ""},
                {"release-edges", 0, "Drop dependency edges once their batch is done", false, false, "", ""},
                {"insertion-order", 0, "Process inputs in the given order", false, false, "", ""},
                {"ignore-pattern", 0, "Skip files matching a gitignore-style pattern (repeatable)", false, true, "", "PATTERN"},
                {"ignore-path", 0, "Ignore file to use instead of .gitignore", false, true, "", "FILE"},
                {"no-ignore", 0, "Disable ignore files and ignore patterns", false, false, "", ""},
                {"deny-warnings", 0, "Exit with 1 if any warning is reported", false, false, "", ""},
                {"max-warnings", 0, "Exit with 1 if more than N warnings are reported", false, true, "", "N"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No paths specified. Use 'modlint lint <paths...>'";
            }
            if (!args.get_unsigned("parallel")) {
                return "--parallel expects a non-negative integer";
            }
            if (args.has("max-warnings") && !args.get_unsigned("max-warnings")) {
                return "--max-warnings expects a non-negative integer";
            }
            if (args.has("batch-multiplier")) {
                const auto k = args.get_unsigned("batch-multiplier");
                if (!k || *k == 0) {
                    return "--batch-multiplier expects a positive integer";
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            if (args.get_flag("verbose")) {
                set_verbosity(Verbosity::Verbose);
                log::set_level(log::Level::Debug);
            } else if (args.get_flag("quiet")) {
                set_verbosity(Verbosity::Quiet);
                log::set_level(log::Level::Warn);
            } else {
                log::set_level(log::Level::Info);
            }

            if (args.get_flag("json")) {
                set_output_format(OutputFormat::JSON);
            }

            std::error_code ec;
            const fs::path cwd = fs::current_path(ec);
            if (ec) {
                print_error("Cannot determine working directory: " + ec.message());
                return runtime::exit_code(runtime::ExitStatus::FatalError);
            }

            config::LintConfig lint_config;
            std::optional<fs::path> config_path;
            if (auto explicit_path = args.get("config")) {
                config_path = fs::path(*explicit_path);
            } else {
                config_path = config::find_config(cwd);
            }
            if (config_path) {
                auto loaded = config::load_config(*config_path);
                if (loaded.is_err()) {
                    print_error(loaded.error().to_string());
                    return runtime::exit_code(runtime::ExitStatus::FatalError);
                }
                lint_config = std::move(loaded).value();
                print_verbose("Using configuration " + config_path->string());
            }

            auto rule_set = config::build_rule_set(lint_config, rules::RuleRegistry::builtin());
            if (rule_set.is_err()) {
                print_error(rule_set.error().to_string());
                return runtime::exit_code(runtime::ExitStatus::FatalError);
            }

            auto loaders = std::make_shared<loader::LoaderRegistry>(loader::LoaderRegistry::with_defaults());
            if (!lint_config.extensions.empty()) {
                loaders->retain(lint_config.extensions);
            }

            fsys::IgnoreMatcher ignore;
            fsys::WalkOptions walk_options;
            if (args.get_flag("no-ignore")) {
                walk_options.ignore_file_name.clear();
            } else {
                const fs::path config_dir = config_path ? config_path->parent_path() : cwd;
                for (const auto& pattern : lint_config.ignore_patterns) {
                    if (auto added = ignore.add(pattern, path_utils::absolute_from(config_dir, cwd)); added.is_err()) {
                        print_error(added.error().to_string());
                        return runtime::exit_code(runtime::ExitStatus::FatalError);
                    }
                }
                for (const auto& pattern : args.get_all("ignore-pattern")) {
                    if (auto added = ignore.add(pattern, cwd); added.is_err()) {
                        print_error(added.error().to_string());
                        return runtime::exit_code(runtime::ExitStatus::FatalError);
                    }
                }
                if (auto ignore_path = args.get("ignore-path")) {
                    if (auto added = ignore.add_file(path_utils::absolute_from(*ignore_path, cwd)); added.is_err()) {
                        print_error(added.error().to_string());
                        return runtime::exit_code(runtime::ExitStatus::FatalError);
                    }
                    walk_options.ignore_file_name.clear();
                }
            }

            const std::vector<fs::path> inputs(args.positional().begin(), args.positional().end());
            auto files = fsys::collect_paths(
                inputs, cwd, std::move(ignore),
                [&loaders](const fs::path& path) {
                    return loaders->supports(path_utils::extension_of(path));
                },
                walk_options);
            if (files.is_err()) {
                print_error(files.error().to_string());
                return runtime::exit_code(runtime::ExitStatus::FatalError);
            }
            if (files.value().empty()) {
                print_warning("No lintable files found");
                return runtime::exit_code(runtime::ExitStatus::Clean);
            }

            runtime::RuntimeOptions options;
            options.concurrency = args.get_unsigned("parallel").value_or(0);
            options.batch_multiplier = args.get_unsigned("batch-multiplier")
                .value_or(static_cast<unsigned int>(lint_config.batch_multiplier.value_or(runtime::DEFAULT_BATCH_MULTIPLIER)));
            options.fix = args.get_flag("fix") || lint_config.fix.value_or(false);
            options.cross_module = !args.get_flag("no-cross-module");
            options.retain_dependency_content = args.get_flag("lint-dependencies");
            options.release_dependency_edges = args.get_flag("release-edges");
            options.ordering = args.get_flag("insertion-order")
                ? runtime::Ordering::Insertion
                : runtime::Ordering::DepthFirst;
            options.deny_warnings = args.get_flag("deny-warnings");
            if (args.has("max-warnings")) {
                options.max_warnings = args.get_unsigned("max-warnings");
            }
            options.cwd = cwd;

            runtime::Collaborators collaborators;
            collaborators.loaders = loaders;
            collaborators.rules = std::move(rule_set).value();

            auto created = runtime::Runtime::create(options, std::move(collaborators));
            if (created.is_err()) {
                print_error(created.error().to_string());
                return runtime::exit_code(runtime::ExitStatus::FatalError);
            }
            auto& lint_runtime = created.value();

            auto ran = lint_runtime->run(files.value());
            if (ran.is_err()) {
                print_error(ran.error().to_string());
                return runtime::exit_code(runtime::ExitStatus::FatalError);
            }
            const runtime::RunReport& report = ran.value();

            if (is_json()) {
                json out;
                out["diagnostics"] = json::array();
                for (const auto& d : report.diagnostics) {
                    out["diagnostics"].push_back(diagnostic_to_json(d, cwd));
                }
                out["status"] = runtime::to_string(report.status);
                out["errors"] = report.error_count();
                out["warnings"] = report.warning_count();
                out["stats"] = stats_to_json(report.stats);
                std::cout << json_utils::to_string(out, 2) << "\n";
                return runtime::exit_code(report.status);
            }

            for (const auto& d : report.diagnostics) {
                if (is_quiet() && d.severity != Severity::Error) {
                    continue;
                }
                Diagnostic shown = d;
                shown.path = path_utils::make_relative(d.path, cwd);
                std::cout << format_diagnostic(shown) << "\n";
            }

            print("");
            print(std::to_string(report.stats.analyzed) + " files analyzed, " +
                  std::to_string(report.stats.modules) + " modules in graph, " +
                  std::to_string(report.error_count()) + " errors, " +
                  std::to_string(report.warning_count()) + " warnings");
            if (options.fix) {
                print(std::to_string(report.stats.fixes_applied) + " fixes applied to " +
                      std::to_string(report.stats.files_written) + " files");
            }
            if (report.error_count() == 0 && report.status == runtime::ExitStatus::DiagnosticsFound) {
                if (options.deny_warnings) {
                    print_error("Warnings are not allowed (--deny-warnings)");
                } else if (options.max_warnings) {
                    print_error("Too many warnings: " + std::to_string(report.warning_count()) +
                                " (maximum " + std::to_string(*options.max_warnings) + ")");
                }
            }

            return runtime::exit_code(report.status);
        }
    };

    /**
     * Rules command - lists the available rules.
     */
    class RulesCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "rules";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List the built-in rules and their default severity";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            const auto rules = rules::RuleRegistry::builtin().list_rules();
            if (args.get_flag("json")) {
                json out = json::array();
                for (const auto* rule : rules) {
                    out.push_back({
                        {"name", std::string(rule->name())},
                        {"description", std::string(rule->description())},
                        {"severity", to_string(rule->default_severity())},
                        {"fixable", rule->fixable()},
                        {"cross_module", rule->needs_graph()}
                    });
                }
                std::cout << json_utils::to_string(out, 2) << "\n";
                return 0;
            }

            for (const auto* rule : rules) {
                std::string line = std::string(rule->name());
                line.resize(std::max<std::size_t>(line.size() + 1, 24), ' ');
                line += to_string(rule->default_severity());
                line.resize(std::max<std::size_t>(line.size() + 1, 34), ' ');
                line += rule->description();
                if (rule->fixable()) {
                    line += " [fixable]";
                }
                std::cout << line << "\n";
            }
            return 0;
        }
    };

    namespace {
        struct LintCommandRegistrar {
            LintCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<LintCommand>());
                CommandRegistry::instance().register_command(std::make_unique<RulesCommand>());
            }
        } lint_registrar;
    }

}  // namespace modlint::cli
