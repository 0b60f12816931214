#ifndef MODLINT_DIAGNOSTIC_CLONER_HPP
#define MODLINT_DIAGNOSTIC_CLONER_HPP

/**
 * @file diagnostic_cloner.hpp
 * @brief The one synchronized path from per-task arenas to the run report.
 *
 * Workers and the coordinator all hand diagnostics to one DiagnosticCloner.
 * Arena-resident messages are deep-copied into heap strings while the lock
 * is held; nothing else about the arenas is shared between threads.
 */

#include "modlint/analysis/lint_message.hpp"
#include "modlint/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>

namespace modlint::analysis {

    namespace fs = std::filesystem;

    class DiagnosticCloner {
    public:
        DiagnosticCloner() = default;

        DiagnosticCloner(const DiagnosticCloner&) = delete;
        DiagnosticCloner& operator=(const DiagnosticCloner&) = delete;

        /**
         * Copies message into the report, shifting its span by offset.
         */
        void clone(
            const fs::path& path,
            std::optional<std::size_t> segment,
            const LintMessage& message,
            std::uint32_t offset
        );

        void add(Diagnostic diagnostic);

        void add_all(const Diagnostics& diagnostics);

        /**
         * Moves out everything collected so far.
         */
        [[nodiscard]] Diagnostics take();

        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        Diagnostics diagnostics_;
    };

}  // namespace modlint::analysis

#endif // MODLINT_DIAGNOSTIC_CLONER_HPP
