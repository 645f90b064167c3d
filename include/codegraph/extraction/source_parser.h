#pragma once

#include <string_view>

#include <codegraph/core/types.h>
#include <codegraph/extraction/syntax_tree.h>
#include <codegraph/model/code_model.h>

namespace codegraph::extraction {

/**
 * @brief Turns source text into a SyntaxNode tree.
 *
 * Implementations must be callable from several threads at once.
 */
class SourceParser {
public:
    virtual ~SourceParser() = default;

    virtual Result<SyntaxNode> parse(std::string_view content, model::Language language) = 0;

    [[nodiscard]] virtual bool supports(model::Language language) const = 0;
};

} // namespace codegraph::extraction
