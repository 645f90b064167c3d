#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <codegraph/core/types.h>
#include <codegraph/extraction/syntax_tree.h>
#include <codegraph/model/code_model.h>
#include <codegraph/model/parse_unit.h>

namespace codegraph::extraction {

/**
 * @brief Symbols and edges produced from one file, in discovery order.
 */
struct ExtractionResult {
    std::vector<model::Symbol> symbols;
    std::vector<model::Edge> edges;

    struct Stats {
        size_t functions = 0;
        size_t methods = 0;
        size_t classes = 0;
        size_t contains = 0;
        size_t imports = 0;
        size_t calls = 0;
        size_t unresolved_calls = 0;
        size_t skipped_nodes = 0;
    } stats;

    void calculate_stats() noexcept;

    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Walks a per-file syntax tree and yields typed symbols and edges.
 *
 * Extraction is best-effort: a node that cannot be turned into a symbol is
 * logged and skipped, the rest of the tree is still processed.
 *
 * Two heuristics are kept on purpose and are relied on by callers:
 *  - imports fan out: a plain `import X` links every top-level function and
 *    class in the file to X, since the statement is file scoped.
 *  - callers are approximated: every call in a file is attributed to the
 *    first function/method symbol extracted from that file.
 *
 * Calls whose callee does not name a function/method in the same file are
 * still emitted, with no target and the callee name in attributes["callee"],
 * so a repository-wide pass can link them later.
 */
class SymbolExtractor {
public:
    SymbolExtractor() = default;

    /// Extract from a tree. Pure with respect to its inputs.
    ExtractionResult extract(const SyntaxNode& root, std::string_view filePath,
                             model::Language language, std::string_view repoId) const;

    /// Extract from unit.tree and store the output in the unit.
    Result<ExtractionResult::Stats> extractInto(model::ParseUnit& unit) const;

    [[nodiscard]] static bool supports(model::Language language) noexcept;
};

} // namespace codegraph::extraction
