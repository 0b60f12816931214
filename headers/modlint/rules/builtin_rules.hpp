#ifndef MODLINT_BUILTIN_RULES_HPP
#define MODLINT_BUILTIN_RULES_HPP

/**
 * @file builtin_rules.hpp
 * @brief Rules shipped with modlint.
 */

#include "modlint/rules/rule.hpp"

namespace modlint::rules {

    /**
     * Reports debugger statements; the fix removes them.
     */
    class NoDebuggerRule final : public IRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "no-debugger"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Disallow debugger statements";
        }
        [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Error; }
        [[nodiscard]] bool fixable() const noexcept override { return true; }

        [[nodiscard]] Result<void, Error> run(RuleContext& ctx) const override;
    };

    class NoDuplicateImportsRule final : public IRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "no-duplicate-imports"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Disallow importing the same module in several declarations";
        }
        [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Warning; }

        [[nodiscard]] Result<void, Error> run(RuleContext& ctx) const override;
    };

    /**
     * Needs semantic data; does nothing without it.
     */
    class NoUnusedImportsRule final : public IRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "no-unused-imports"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Disallow imported bindings that are never referenced";
        }
        [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Warning; }

        [[nodiscard]] Result<void, Error> run(RuleContext& ctx) const override;
    };

    class NoSelfImportRule final : public IRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "no-self-import"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Disallow a module from importing itself";
        }
        [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Error; }
        [[nodiscard]] bool needs_graph() const noexcept override { return true; }

        [[nodiscard]] Result<void, Error> run(RuleContext& ctx) const override;
    };

    /**
     * Off by default. Walks the graph once per resolved import.
     */
    class NoCycleRule final : public IRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "import/no-cycle"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Disallow imports that lead back to the importing module";
        }
        [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Off; }
        [[nodiscard]] bool needs_graph() const noexcept override { return true; }

        [[nodiscard]] Result<void, Error> run(RuleContext& ctx) const override;
    };

    /**
     * Off by default. Named imports are checked against the export names
     * of the resolved module; modules that declare no exports, or
     * re-export with "export *", are not checked.
     */
    class ImportNamedRule final : public IRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "import/named"; }
        [[nodiscard]] std::string_view description() const noexcept override {
            return "Disallow named imports that the imported module does not export";
        }
        [[nodiscard]] Severity default_severity() const noexcept override { return Severity::Off; }
        [[nodiscard]] bool needs_graph() const noexcept override { return true; }

        [[nodiscard]] Result<void, Error> run(RuleContext& ctx) const override;
    };

}  // namespace modlint::rules

#endif // MODLINT_BUILTIN_RULES_HPP
