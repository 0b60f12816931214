#ifndef MODLINT_MODULE_RECORD_HPP
#define MODLINT_MODULE_RECORD_HPP

/**
 * @file module_record.hpp
 * @brief Import/export facts of one segment.
 *
 * A ModuleRecord is built by a worker from the segment's structural tree and
 * handed to the graph coordinator, which owns it from then on. After the
 * dependency closure of its batch completes, the coordinator fills
 * loaded_modules; rules then read it, never write it.
 */

#include "modlint/types.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace modlint::graph {

    namespace fs = std::filesystem;

    enum class RequestKind {
        Import,
        ReExport
    };

    /**
     * One "import ... from" or "export ... from" in source order.
     */
    struct ModuleRequest {
        std::string specifier;
        RequestKind kind = RequestKind::Import;
        Span span;          // of the specifier string, file-absolute
        bool type_only = false;
    };

    struct ImportEntry {
        std::string specifier;
        std::string imported;   // "default", "*" or a name
        std::string local;
        Span span;          // of the local binding, file-absolute
        bool type_only = false;
    };

    struct ModuleRecord {
        fs::path path;
        std::size_t segment = 0;

        std::vector<ModuleRequest> requests;
        std::vector<ImportEntry> imports;
        std::vector<std::string> export_names;

        /**
         * Set by "export * from"; such a module may export any name.
         */
        bool has_star_reexport = false;

        /**
         * Specifier -> record of the resolved target (its last segment).
         * Non-owning; the graph keeps every record alive.
         */
        std::map<std::string, const ModuleRecord*, std::less<>> loaded_modules;

        [[nodiscard]] bool exports_name(const std::string& name) const {
            for (const auto& n : export_names) {
                if (n == name) {
                    return true;
                }
            }
            return false;
        }
    };

}  // namespace modlint::graph

#endif // MODLINT_MODULE_RECORD_HPP
