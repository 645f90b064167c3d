#include <codegraph/pipeline/structural_analyzer.h>

#include <spdlog/spdlog.h>

namespace codegraph::pipeline {

namespace {

nlohmann::json finding(std::string_view severity, std::string_view rule, std::string message,
                       const std::string& file, std::uint32_t line) {
    return nlohmann::json{{"severity", severity},
                          {"rule", rule},
                          {"message", std::move(message)},
                          {"file", file},
                          {"line", line}};
}

} // namespace

Result<nlohmann::json> StructuralAnalyzer::analyze(const graph::GraphReader& graph,
                                                   const std::string& repoId) {
    auto orphans = graph.orphanSymbols(repoId);
    if (!orphans)
        return orphans.error();
    auto cycles = graph.cycles(repoId);
    if (!cycles)
        return cycles.error();
    auto endpoints = graph.endpointsWithoutValidation(repoId);
    if (!endpoints)
        return endpoints.error();
    auto calls = graph.callGraph(repoId);
    if (!calls)
        return calls.error();

    nlohmann::json out;
    auto findings = nlohmann::json::array();

    auto orphanList = nlohmann::json::array();
    for (const auto& s : orphans.value()) {
        orphanList.push_back({{"id", s.id},
                              {"name", s.name},
                              {"kind", model::toString(s.kind)},
                              {"file", s.filePath},
                              {"line", s.span.startLine}});
        // Methods are reached through their class; only free functions are suspicious.
        if (s.kind == model::SymbolKind::Function) {
            findings.push_back(finding("info", "unreferenced-function",
                                       fmt::format("Function '{}' has no callers", s.name),
                                       s.filePath, s.span.startLine));
        }
    }
    out["orphans"] = std::move(orphanList);

    auto cycleList = nlohmann::json::array();
    for (const auto& cycle : cycles.value()) {
        cycleList.push_back(cycle);
        std::string path;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i)
                path += " -> ";
            path += cycle[i];
        }
        findings.push_back(
            finding("warning", "dependency-cycle", "Cycle: " + path, std::string{}, 0));
    }
    out["cycles"] = std::move(cycleList);

    auto endpointList = nlohmann::json::array();
    for (const auto& e : endpoints.value()) {
        endpointList.push_back({{"id", e.symbolId},
                                {"name", e.name},
                                {"file", e.filePath},
                                {"line", e.line},
                                {"parameters", e.parameters}});
        findings.push_back(finding(
            "warning", "missing-input-validation",
            fmt::format("'{}' takes parameters but calls no validation routine", e.name),
            e.filePath, e.line));
    }
    out["endpoints_without_validation"] = std::move(endpointList);

    size_t callEdges = 0;
    for (const auto& [caller, callees] : calls.value())
        callEdges += callees.size();
    out["call_graph_size"] = callEdges;
    out["findings"] = std::move(findings);

    spdlog::debug("Structural analysis of {}: {} orphans, {} cycles, {} unvalidated endpoints",
                  repoId, orphans.value().size(), cycles.value().size(),
                  endpoints.value().size());
    return out;
}

} // namespace codegraph::pipeline
