#pragma once

#include <memory>

#include <codegraph/extraction/grammar_loader.h>
#include <codegraph/extraction/source_parser.h>

namespace codegraph::extraction {

/**
 * @brief SourceParser backed by tree-sitter grammars loaded at runtime.
 *
 * A fresh TSParser is used per call, so one instance can serve concurrent
 * jobs.
 */
class TreeSitterParser final : public SourceParser {
public:
    explicit TreeSitterParser(std::shared_ptr<GrammarLoader> loader);

    Result<SyntaxNode> parse(std::string_view content, model::Language language) override;

    [[nodiscard]] bool supports(model::Language language) const override;

private:
    std::shared_ptr<GrammarLoader> loader_;
};

} // namespace codegraph::extraction
