#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::extraction {

/// 0-based row/column, as produced by tree-sitter.
struct SyntaxPoint {
    std::uint32_t row = 0;
    std::uint32_t column = 0;
};

/**
 * @brief Parser-independent syntax tree node.
 *
 * The extractor only ever sees this shape. Children are owned by value;
 * fieldName is the grammar field under which this node hangs in its parent
 * (empty when the grammar names none). text carries the node's source slice
 * for the node types the extractor reads text from.
 */
struct SyntaxNode {
    std::string type;
    std::string fieldName;
    std::string text;
    SyntaxPoint start;
    SyntaxPoint end;
    bool named = true;
    std::vector<SyntaxNode> children;

    /// First child hanging under the given field, or nullptr.
    const SyntaxNode* childByField(std::string_view field) const noexcept;

    /// First child of the given type, or nullptr.
    const SyntaxNode* firstChildOfType(std::string_view childType) const noexcept;

    std::vector<const SyntaxNode*> childrenOfType(std::string_view childType) const;

    /// Depth-first, document-order visit of this node and every descendant.
    template <typename Visitor> void walk(Visitor&& visit) const {
        visit(*this);
        for (const auto& child : children) {
            child.walk(visit);
        }
    }
};

} // namespace codegraph::extraction
