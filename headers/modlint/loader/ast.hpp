#ifndef MODLINT_AST_HPP
#define MODLINT_AST_HPP

/**
 * @file ast.hpp
 * @brief Structural tree produced by the script parser.
 *
 * The tree is deliberately shallow: one Node per top-level statement, with
 * the facts the runtime and the rule catalog need (module requests, bindings
 * introduced, identifiers referenced). Every node, vector and string view
 * lives in the arena the segment was parsed into; nothing here owns memory.
 *
 * All spans are relative to the start of the segment.
 */

#include "modlint/types.hpp"

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

namespace modlint::loader {

    enum class NodeKind {
        ImportDeclaration,
        ExportDeclaration,
        DebuggerStatement,
        VariableDeclaration,
        FunctionDeclaration,
        ClassDeclaration,
        ExpressionStatement
    };

    [[nodiscard]] const char* to_string(NodeKind kind) noexcept;

    /**
     * An identifier occurrence.
     */
    struct Identifier {
        std::string_view name;
        Span span;
    };

    /**
     * One name bound by an import, or one name exported by an export.
     *
     * For imports, imported is "default", "*" or the exported name of the
     * target, and local is the binding created in this module. For exports,
     * local is the local name (empty for "export * from") and imported is the
     * exported name.
     */
    struct ImportBinding {
        std::string_view local;
        std::string_view imported;
        Span span;
        bool type_only = false;
    };

    struct Node {
        explicit Node(const NodeKind k, std::pmr::memory_resource* mr)
            : kind(k), bindings(mr), declared(mr), references(mr) {}

        NodeKind kind;
        Span span;

        // Module specifier for imports and "export ... from"; empty otherwise.
        std::string_view source;
        Span source_span;
        bool has_source = false;
        bool type_only = false;

        // "export default ..."
        bool is_default_export = false;

        std::pmr::vector<ImportBinding> bindings;
        std::pmr::vector<Identifier> declared;
        std::pmr::vector<Identifier> references;
    };

    /**
     * Parsed form of one segment.
     */
    struct StructuralTree {
        explicit StructuralTree(std::pmr::memory_resource* mr) : body(mr) {}

        std::string_view text;
        SourceType source_type;
        std::pmr::vector<Node*> body;

        [[nodiscard]] std::size_t count(NodeKind kind) const noexcept {
            std::size_t n = 0;
            for (const Node* node : body) {
                if (node->kind == kind) {
                    ++n;
                }
            }
            return n;
        }
    };

}  // namespace modlint::loader

#endif // MODLINT_AST_HPP
