#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <codegraph/core/types.h>
#include <codegraph/graph/connection_pool.h>
#include <codegraph/model/code_model.h>

namespace codegraph::graph {

/// Caller name -> callee names, one entry per calls relationship.
using CallGraph = std::map<std::string, std::vector<std::string>>;

/// Symbol names along a cycle; the first and last entries are the same symbol.
using CyclePath = std::vector<std::string>;

struct EndpointInfo {
    std::string symbolId;
    std::string name;
    std::string filePath;
    std::uint32_t line = 0;
    std::vector<std::string> parameters;
};

struct GraphStats {
    std::size_t symbols = 0;
    std::size_t edges = 0;
    std::size_t relationships = 0;
    std::size_t unresolvedEdges = 0;
};

struct ImportStats {
    std::size_t symbols = 0;
    std::size_t edges = 0;
};

enum class ExportFormat { GraphML, Json };

Result<ExportFormat> parseExportFormat(std::string_view name);

struct GraphStoreConfig {
    std::string dbPath;
    ConnectionPoolConfig pool;
    std::size_t maxCycles = 100;     ///< cycles() stops after this many
    std::size_t maxCycleLength = 32; ///< longest path explored by cycles()
    std::size_t maxCycleSteps = 1'000'000; ///< edge visits before cycles() gives up
};

/**
 * @brief Read-only view of the code graph.
 *
 * Downstream analyses receive this interface, never the writable store.
 * Every call fails with ErrorCode::NotConnected before connect() and with
 * ErrorCode::ServiceUnavailable when the backing database cannot be reached.
 */
class GraphReader {
public:
    virtual ~GraphReader() = default;

    /// Point lookups; std::nullopt when absent.
    virtual Result<std::optional<model::Symbol>> getSymbol(const std::string& id) const = 0;
    virtual Result<std::optional<model::Edge>> getEdge(const std::string& id) const = 0;

    /// Ordered by (file path, start line).
    virtual Result<std::vector<model::Symbol>> getSymbolsByRepo(const std::string& repoId) const = 0;
    /// Ordered by the source symbol's (file path, start line), then insertion.
    virtual Result<std::vector<model::Edge>> getEdgesByRepo(const std::string& repoId) const = 0;
    virtual Result<std::vector<model::Symbol>>
    getSymbolsByFile(const std::string& repoId, const std::string& filePath) const = 0;

    virtual Result<CallGraph> callGraph(const std::string& repoId) const = 0;

    /// Non-module symbols without any incoming relationship.
    virtual Result<std::vector<model::Symbol>> orphanSymbols(const std::string& repoId) const = 0;

    /// Directed cycles over all relationship kinds, capped at maxCycles cycles
    /// and maxCycleSteps edge visits.
    virtual Result<std::vector<CyclePath>> cycles(const std::string& repoId) const = 0;

    /// Functions with parameters and no relationship to a *validate*/*check* symbol.
    virtual Result<std::vector<EndpointInfo>>
    endpointsWithoutValidation(const std::string& repoId) const = 0;

    virtual Result<GraphStats> stats(const std::string& repoId) const = 0;

    /// Serialize a repository's graph. Node and edge order is unspecified.
    virtual Result<std::string> exportDocument(const std::string& repoId,
                                               ExportFormat format) const = 0;

    /// exportDocument() written to a file.
    Result<void> exportGraph(const std::string& repoId, const std::filesystem::path& target,
                             ExportFormat format) const;
};

/**
 * @brief Idempotent persistent graph of symbols and edges.
 *
 * Upserts merge by identity. upsertEdge also materializes a relationship
 * between the two endpoint symbols once both exist; edges with an absent
 * target are stored but never materialized. Safe for concurrent use.
 */
class GraphStore : public GraphReader {
public:
    virtual Result<void> connect() = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    virtual Result<void> upsertSymbol(const model::Symbol& symbol) = 0;
    virtual Result<void> upsertEdge(const model::Edge& edge) = 0;

    /// Batch forms; each batch is applied in one transaction.
    virtual Result<void> upsertSymbols(const std::vector<model::Symbol>& symbols) = 0;
    virtual Result<void> upsertEdges(const std::vector<model::Edge>& edges) = 0;

    /**
     * @brief Link unresolved calls edges to repository symbols by name.
     *
     * Each placeholder (calls edge without target) is replaced by one calls
     * edge per matching function/method (methods only for attribute calls).
     * @return number of edges created
     */
    virtual Result<std::size_t> resolveCrossFileCalls(const std::string& repoId) = 0;

    /**
     * @brief Load {"symbols": [...], "edges": [...]}, symbols first, through
     * the upsert path. The JSON export is accepted as input.
     */
    virtual Result<ImportStats> importBulk(const nlohmann::json& data) = 0;
};

std::unique_ptr<GraphStore> makeSqliteGraphStore(GraphStoreConfig config);

} // namespace codegraph::graph
