#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <codegraph/extraction/syntax_tree.h>
#include <codegraph/model/code_model.h>

namespace codegraph::model {

/**
 * @brief One source file moving through the pipeline.
 *
 * Built by the indexer, filled once by the extractor, read-only after that.
 */
struct ParseUnit {
    std::string id;
    std::string repoId;
    std::string path; ///< Repository-relative path, '/' separated
    Language language = Language::Python;
    std::string content;
    std::optional<extraction::SyntaxNode> tree;
    std::vector<Symbol> symbols;
    std::vector<Edge> edges;
    std::size_t sizeBytes = 0;

    /// Byte size, falling back to the content length when not supplied.
    [[nodiscard]] std::size_t size() const noexcept {
        return sizeBytes != 0 ? sizeBytes : content.size();
    }
};

} // namespace codegraph::model
