#pragma once

#include <string>

#include <codegraph/pipeline/collaborators.h>

namespace codegraph::pipeline {

/**
 * @brief Built-in analysis over the structural queries of the graph.
 *
 * Output:
 * {"orphans": [...], "cycles": [[...]], "endpoints_without_validation": [...],
 *  "call_graph_size": n, "findings": [{"severity", "rule", "message", "file", "line"}]}
 */
class StructuralAnalyzer final : public GraphAnalyzer {
public:
    [[nodiscard]] std::string name() const override { return "structural"; }

    Result<nlohmann::json> analyze(const graph::GraphReader& graph,
                                   const std::string& repoId) override;
};

} // namespace codegraph::pipeline
