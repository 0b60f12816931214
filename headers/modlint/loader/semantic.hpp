#ifndef MODLINT_SEMANTIC_HPP
#define MODLINT_SEMANTIC_HPP

/**
 * @file semantic.hpp
 * @brief Module-scope bindings and references of one segment.
 *
 * Built from a StructuralTree and allocated in the same arena. Only the
 * module scope is modelled: names introduced by top-level imports and
 * declarations, and every identifier referenced anywhere in the segment.
 */

#include "modlint/loader/ast.hpp"
#include "modlint/memory/arena.hpp"

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

namespace modlint::loader {

    enum class BindingKind {
        Import,
        Variable,
        Function,
        Class
    };

    struct Binding {
        std::string_view name;
        BindingKind kind = BindingKind::Variable;
        Span span;
        const Node* declaration = nullptr;
        bool type_only = false;
    };

    class SemanticModel {
    public:
        explicit SemanticModel(std::pmr::memory_resource* mr)
            : bindings_(mr), references_(mr) {}

        [[nodiscard]] const std::pmr::vector<Binding>& bindings() const noexcept {
            return bindings_;
        }

        [[nodiscard]] const std::pmr::vector<Identifier>& references() const noexcept {
            return references_;
        }

        [[nodiscard]] const Binding* find_binding(std::string_view name) const noexcept;

        [[nodiscard]] std::size_t reference_count(std::string_view name) const noexcept;

        [[nodiscard]] bool is_referenced(const std::string_view name) const noexcept {
            return reference_count(name) > 0;
        }

    private:
        friend class SemanticBuilder;

        std::pmr::vector<Binding> bindings_;
        std::pmr::vector<Identifier> references_;
    };

    class SemanticBuilder {
    public:
        /**
         * Builds the semantic model of tree inside arena.
         */
        [[nodiscard]] static SemanticModel* build(memory::Arena& arena, const StructuralTree& tree);
    };

}  // namespace modlint::loader

#endif // MODLINT_SEMANTIC_HPP
