#include "modlint/loader/semantic.hpp"

namespace modlint::loader {

    const Binding* SemanticModel::find_binding(const std::string_view name) const noexcept {
        for (const auto& binding : bindings_) {
            if (binding.name == name) {
                return &binding;
            }
        }
        return nullptr;
    }

    std::size_t SemanticModel::reference_count(const std::string_view name) const noexcept {
        std::size_t count = 0;
        for (const auto& ref : references_) {
            if (ref.name == name) {
                ++count;
            }
        }
        return count;
    }

    SemanticModel* SemanticBuilder::build(memory::Arena& arena, const StructuralTree& tree) {
        auto* model = arena.make<SemanticModel>(&arena);

        for (const Node* node : tree.body) {
            switch (node->kind) {
                case NodeKind::ImportDeclaration:
                    for (const auto& binding : node->bindings) {
                        model->bindings_.push_back(Binding{
                            binding.local, BindingKind::Import, binding.span, node, binding.type_only
                        });
                    }
                    break;

                case NodeKind::FunctionDeclaration:
                case NodeKind::ClassDeclaration:
                case NodeKind::VariableDeclaration:
                case NodeKind::ExportDeclaration: {
                    const BindingKind kind =
                        node->kind == NodeKind::FunctionDeclaration ? BindingKind::Function :
                        node->kind == NodeKind::ClassDeclaration ? BindingKind::Class :
                        BindingKind::Variable;
                    for (const auto& name : node->declared) {
                        model->bindings_.push_back(Binding{name.name, kind, name.span, node, false});
                    }
                    break;
                }

                case NodeKind::DebuggerStatement:
                case NodeKind::ExpressionStatement:
                    break;
            }

            for (const auto& ref : node->references) {
                model->references_.push_back(ref);
            }
        }

        return model;
    }

}  // namespace modlint::loader
