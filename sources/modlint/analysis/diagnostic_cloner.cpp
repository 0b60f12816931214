#include "modlint/analysis/diagnostic_cloner.hpp"

#include <string>
#include <utility>

namespace modlint::analysis {

    void DiagnosticCloner::clone(
        const fs::path& path,
        const std::optional<std::size_t> segment,
        const LintMessage& message,
        const std::uint32_t offset
    ) {
        std::lock_guard lock(mutex_);

        Diagnostic& d = diagnostics_.emplace_back();
        d.path = path;
        d.segment = segment;
        if (message.span) {
            d.span = message.span->shifted(offset);
        }
        d.severity = message.severity;
        d.code = std::string(message.code);
        d.message = std::string(message.message);
        if (!message.help.empty()) {
            d.help = std::string(message.help);
        }
    }

    void DiagnosticCloner::add(Diagnostic diagnostic) {
        std::lock_guard lock(mutex_);
        diagnostics_.push_back(std::move(diagnostic));
    }

    void DiagnosticCloner::add_all(const Diagnostics& diagnostics) {
        std::lock_guard lock(mutex_);
        diagnostics_.insert(diagnostics_.end(), diagnostics.begin(), diagnostics.end());
    }

    Diagnostics DiagnosticCloner::take() {
        std::lock_guard lock(mutex_);
        Diagnostics result;
        result.swap(diagnostics_);
        return result;
    }

    std::size_t DiagnosticCloner::size() const {
        std::lock_guard lock(mutex_);
        return diagnostics_.size();
    }

}  // namespace modlint::analysis
