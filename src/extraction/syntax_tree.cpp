#include <codegraph/extraction/syntax_tree.h>

namespace codegraph::extraction {

const SyntaxNode* SyntaxNode::childByField(std::string_view field) const noexcept {
    for (const auto& child : children) {
        if (child.fieldName == field)
            return &child;
    }
    return nullptr;
}

const SyntaxNode* SyntaxNode::firstChildOfType(std::string_view childType) const noexcept {
    for (const auto& child : children) {
        if (child.type == childType)
            return &child;
    }
    return nullptr;
}

std::vector<const SyntaxNode*> SyntaxNode::childrenOfType(std::string_view childType) const {
    std::vector<const SyntaxNode*> out;
    for (const auto& child : children) {
        if (child.type == childType)
            out.push_back(&child);
    }
    return out;
}

} // namespace codegraph::extraction
