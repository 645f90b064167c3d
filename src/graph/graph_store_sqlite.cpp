#include <codegraph/graph/graph_export.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/graph/migration.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include <codegraph/core/ids.h>

namespace codegraph::graph {

using model::Edge;
using model::Symbol;

namespace {

constexpr const char* kSymbolColumns =
    "s.id, s.repo_id, s.name, s.kind, s.file_path, s.language, s.start_line, s.start_column, "
    "s.end_line, s.end_column, s.docstring, s.signature, s.parent_id, s.attributes";

constexpr const char* kEdgeColumns =
    "e.id, e.repo_id, e.source_id, e.target_id, e.kind, e.attributes";

nlohmann::json parseAttributes(const std::string& text) {
    if (text.empty())
        return nlohmann::json::object();
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::warn("Ignoring malformed attribute blob: {}", text.substr(0, 80));
        return nlohmann::json::object();
    }
    return parsed;
}

Result<Symbol> readSymbol(const Statement& stmt) {
    Symbol s;
    s.id = stmt.getString(0);
    s.repoId = stmt.getString(1);
    s.name = stmt.getString(2);
    auto kind = model::parseSymbolKind(stmt.getString(3));
    if (!kind)
        return kind.error();
    s.kind = kind.value();
    s.filePath = stmt.getString(4);
    auto language = model::parseLanguage(stmt.getString(5));
    if (!language)
        return language.error();
    s.language = language.value();
    s.span.startLine = static_cast<std::uint32_t>(stmt.getInt64(6));
    s.span.startColumn = static_cast<std::uint32_t>(stmt.getInt64(7));
    s.span.endLine = static_cast<std::uint32_t>(stmt.getInt64(8));
    s.span.endColumn = static_cast<std::uint32_t>(stmt.getInt64(9));
    s.docstring = stmt.getOptionalString(10);
    s.signature = stmt.getOptionalString(11);
    s.parentId = stmt.getOptionalString(12);
    s.attributes = parseAttributes(stmt.getString(13));
    return s;
}

Result<Edge> readEdge(const Statement& stmt) {
    Edge e;
    e.id = stmt.getString(0);
    e.repoId = stmt.getString(1);
    e.sourceId = stmt.getString(2);
    e.targetId = stmt.getOptionalString(3);
    auto kind = model::parseEdgeKind(stmt.getString(4));
    if (!kind)
        return kind.error();
    e.kind = kind.value();
    e.attributes = parseAttributes(stmt.getString(5));
    return e;
}

// Collect all rows of a prepared statement through a row reader.
template <typename T, typename Reader>
Result<std::vector<T>> collectRows(Statement& stmt, Reader&& reader) {
    std::vector<T> out;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        auto row = reader(stmt);
        if (!row)
            return row.error();
        out.push_back(std::move(row).value());
    }
    return out;
}

/**
 * Prepared upsert statements bound to one connection; reused across a batch.
 */
class GraphWriter {
public:
    static Result<GraphWriter> create(Database& db) {
        GraphWriter w;
        auto prepare = [&](Statement& target, const char* sql) -> Result<void> {
            auto r = db.prepare(sql);
            if (!r)
                return r.error();
            target = std::move(r).value();
            return {};
        };

        Result<void> r = prepare(w.upsertSymbol_, R"(
            INSERT INTO symbols (id, repo_id, name, kind, file_path, language, start_line,
                                 start_column, end_line, end_column, docstring, signature,
                                 parent_id, attributes)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                repo_id = excluded.repo_id, name = excluded.name, kind = excluded.kind,
                file_path = excluded.file_path, language = excluded.language,
                start_line = excluded.start_line, start_column = excluded.start_column,
                end_line = excluded.end_line, end_column = excluded.end_column,
                docstring = excluded.docstring, signature = excluded.signature,
                parent_id = excluded.parent_id, attributes = excluded.attributes
        )");
        if (!r)
            return r.error();
        // Edges stored before one of their endpoints become relationships here.
        r = prepare(w.materializePending_, R"(
            INSERT INTO relationships (edge_id, source_id, target_id, kind, attributes)
            SELECT e.id, e.source_id, e.target_id, e.kind, e.attributes FROM edges e
            WHERE (e.source_id = ?1 OR e.target_id = ?1) AND e.target_id IS NOT NULL
              AND EXISTS (SELECT 1 FROM symbols a WHERE a.id = e.source_id)
              AND EXISTS (SELECT 1 FROM symbols b WHERE b.id = e.target_id)
            ON CONFLICT(edge_id) DO NOTHING
        )");
        if (!r)
            return r.error();
        r = prepare(w.upsertEdge_, R"(
            INSERT INTO edges (id, repo_id, source_id, target_id, kind, attributes)
            VALUES (?, ?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                repo_id = excluded.repo_id, source_id = excluded.source_id,
                target_id = excluded.target_id, kind = excluded.kind,
                attributes = excluded.attributes
        )");
        if (!r)
            return r.error();
        r = prepare(w.countEndpoints_,
                    "SELECT COUNT(*) FROM symbols WHERE id = ? OR id = ?");
        if (!r)
            return r.error();
        r = prepare(w.upsertRelationship_, R"(
            INSERT INTO relationships (edge_id, source_id, target_id, kind, attributes)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(edge_id) DO UPDATE SET
                source_id = excluded.source_id, target_id = excluded.target_id,
                kind = excluded.kind, attributes = excluded.attributes
        )");
        if (!r)
            return r.error();
        r = prepare(w.deleteRelationship_, "DELETE FROM relationships WHERE edge_id = ?");
        if (!r)
            return r.error();
        return w;
    }

    Result<void> write(const Symbol& s) {
        auto r = rebind(upsertSymbol_);
        if (!r)
            return r;
        r = upsertSymbol_.bindAll(
            s.id, s.repoId, s.name, model::toString(s.kind), s.filePath,
            model::toString(s.language), static_cast<int64_t>(s.span.startLine),
            static_cast<int64_t>(s.span.startColumn), static_cast<int64_t>(s.span.endLine),
            static_cast<int64_t>(s.span.endColumn), s.docstring, s.signature, s.parentId,
            s.attributes.dump());
        if (!r)
            return r;
        r = upsertSymbol_.execute();
        if (!r)
            return r;

        r = rebind(materializePending_);
        if (!r)
            return r;
        r = materializePending_.bind(1, s.id);
        if (!r)
            return r;
        return materializePending_.execute();
    }

    Result<void> write(const Edge& e) {
        const auto attributes = e.attributes.dump();
        auto r = rebind(upsertEdge_);
        if (!r)
            return r;
        r = upsertEdge_.bindAll(e.id, e.repoId, e.sourceId, e.targetId, model::toString(e.kind),
                                attributes);
        if (!r)
            return r;
        r = upsertEdge_.execute();
        if (!r)
            return r;

        bool endpointsExist = false;
        if (e.targetId) {
            r = rebind(countEndpoints_);
            if (!r)
                return r;
            r = countEndpoints_.bindAll(e.sourceId, *e.targetId);
            if (!r)
                return r;
            auto step = countEndpoints_.step();
            if (!step)
                return step.error();
            const int64_t expected = (e.sourceId == *e.targetId) ? 1 : 2;
            endpointsExist = step.value() && countEndpoints_.getInt64(0) == expected;
        }

        if (!endpointsExist) {
            r = rebind(deleteRelationship_);
            if (!r)
                return r;
            r = deleteRelationship_.bind(1, e.id);
            if (!r)
                return r;
            return deleteRelationship_.execute();
        }

        r = rebind(upsertRelationship_);
        if (!r)
            return r;
        r = upsertRelationship_.bindAll(e.id, e.sourceId, *e.targetId, model::toString(e.kind),
                                        attributes);
        if (!r)
            return r;
        return upsertRelationship_.execute();
    }

private:
    GraphWriter() = default;

    static Result<void> rebind(Statement& stmt) {
        auto r = stmt.reset();
        if (!r)
            return r;
        return stmt.clearBindings();
    }

    Statement upsertSymbol_;
    Statement materializePending_;
    Statement upsertEdge_;
    Statement countEndpoints_;
    Statement upsertRelationship_;
    Statement deleteRelationship_;
};

using Adjacency = std::map<std::string, std::set<std::string>>;

const std::set<std::string>& successorsOf(const Adjacency& adjacency, const std::string& node) {
    static const std::set<std::string> kNone;
    auto it = adjacency.find(node);
    return it == adjacency.end() ? kNone : it->second;
}

/// Tarjan's strongly connected components, iterative. Maps every node,
/// including pure targets, to its component index.
std::unordered_map<std::string, std::size_t> stronglyConnected(const Adjacency& adjacency,
                                                               std::vector<std::size_t>& sizes) {
    struct Frame {
        const std::string* node;
        std::set<std::string>::const_iterator next;
        std::set<std::string>::const_iterator end;
    };

    std::unordered_map<std::string, std::size_t> index;
    std::unordered_map<std::string, std::size_t> low;
    std::unordered_set<std::string> onStack;
    std::vector<const std::string*> stack;
    std::vector<Frame> frames;
    std::unordered_map<std::string, std::size_t> component;
    std::size_t counter = 0;

    auto visit = [&](const std::string& node) {
        index[node] = low[node] = counter++;
        stack.push_back(&node);
        onStack.insert(node);
        const auto& succ = successorsOf(adjacency, node);
        frames.push_back({&node, succ.begin(), succ.end()});
    };

    for (const auto& [root, _] : adjacency) {
        if (index.contains(root))
            continue;
        visit(root);
        while (!frames.empty()) {
            auto& frame = frames.back();
            if (frame.next != frame.end) {
                const std::string& next = *frame.next++;
                if (!index.contains(next)) {
                    visit(next);
                } else if (onStack.contains(next)) {
                    low[*frame.node] = std::min(low[*frame.node], index[next]);
                }
                continue;
            }

            const std::string& node = *frame.node;
            frames.pop_back();
            if (!frames.empty()) {
                auto& parentLow = low[*frames.back().node];
                parentLow = std::min(parentLow, low[node]);
            }
            if (low[node] != index[node])
                continue;

            const std::size_t id = sizes.size();
            std::size_t members = 0;
            const std::string* member = nullptr;
            do {
                member = stack.back();
                stack.pop_back();
                onStack.erase(*member);
                component[*member] = id;
                ++members;
            } while (member != &node);
            sizes.push_back(members);
        }
    }
    return component;
}

/**
 * @brief Elementary cycle enumeration in the manner of Johnson (1975).
 *
 * Cycles are reported once, from their smallest node id, in the order a plain
 * depth-first search would find them. A start node only explores its own
 * strongly connected component, nodes that cannot reach the start stay
 * blocked until a cycle frees them, and the total number of edge visits is
 * capped by maxCycleSteps.
 */
class CycleFinder {
public:
    CycleFinder(const Adjacency& adjacency, const std::unordered_map<std::string, std::string>& names,
                const GraphStoreConfig& limits)
        : adjacency_(adjacency), names_(names), limits_(limits) {}

    std::vector<CyclePath> run() {
        std::vector<std::size_t> sizes;
        component_ = stronglyConnected(adjacency_, sizes);

        for (const auto& [start, successors] : adjacency_) {
            if (done())
                break;
            const auto id = component_.at(start);
            if (sizes[id] == 1 && !successors.contains(start))
                continue;
            start_ = &start;
            startComponent_ = id;
            blocked_.clear();
            blockedBy_.clear();
            path_.clear();
            circuit(start);
        }

        if (steps_ >= limits_.maxCycleSteps) {
            spdlog::warn("Cycle search stopped after {} steps with {} cycles found", steps_,
                         found_.size());
        } else if (found_.size() >= limits_.maxCycles) {
            spdlog::debug("Cycle search stopped at cap of {}", limits_.maxCycles);
        }
        return std::move(found_);
    }

private:
    bool done() const {
        return found_.size() >= limits_.maxCycles || steps_ >= limits_.maxCycleSteps;
    }

    bool eligible(const std::string& node) const {
        return *start_ < node && component_.at(node) == startComponent_;
    }

    // True when a cycle was closed below node, or when the search below it was
    // cut short; either way node must not stay blocked.
    bool circuit(const std::string& node) {
        bool closed = false;
        path_.push_back(&node);
        blocked_.insert(node);

        const auto& successors = successorsOf(adjacency_, node);
        for (const auto& next : successors) {
            if (done()) {
                closed = true;
                break;
            }
            ++steps_;
            if (next == *start_) {
                emit();
                closed = true;
            } else if (!eligible(next)) {
                continue;
            } else if (path_.size() >= limits_.maxCycleLength) {
                closed = true;
            } else if (!blocked_.contains(next) && circuit(next)) {
                closed = true;
            }
        }

        if (closed) {
            unblock(node);
        } else {
            for (const auto& next : successors) {
                if (eligible(next))
                    blockedBy_[next].insert(node);
            }
        }
        path_.pop_back();
        return closed;
    }

    void unblock(const std::string& node) {
        std::vector<std::string> pending{node};
        while (!pending.empty()) {
            auto current = std::move(pending.back());
            pending.pop_back();
            blocked_.erase(current);
            auto it = blockedBy_.find(current);
            if (it == blockedBy_.end())
                continue;
            for (const auto& waiting : it->second) {
                if (blocked_.contains(waiting))
                    pending.push_back(waiting);
            }
            blockedBy_.erase(it);
        }
    }

    void emit() {
        CyclePath cycle;
        cycle.reserve(path_.size() + 1);
        for (const auto* id : path_)
            cycle.push_back(names_.at(*id));
        cycle.push_back(names_.at(*start_));
        found_.push_back(std::move(cycle));
    }

    const Adjacency& adjacency_;
    const std::unordered_map<std::string, std::string>& names_;
    const GraphStoreConfig& limits_;

    std::unordered_map<std::string, std::size_t> component_;
    const std::string* start_ = nullptr;
    std::size_t startComponent_ = 0;
    std::vector<const std::string*> path_;
    std::unordered_set<std::string> blocked_;
    std::unordered_map<std::string, std::unordered_set<std::string>> blockedBy_;
    std::size_t steps_ = 0;
    std::vector<CyclePath> found_;
};

} // namespace

class SqliteGraphStore final : public GraphStore {
public:
    explicit SqliteGraphStore(GraphStoreConfig config) : config_(std::move(config)) {}

    ~SqliteGraphStore() override { close(); }

    Result<void> connect() override {
        std::lock_guard<std::mutex> lock(poolMutex_);
        if (pool_)
            return {};
        if (config_.dbPath.empty()) {
            return Error{ErrorCode::InvalidArgument, "Graph store database path is empty"};
        }

        auto pool = std::make_shared<ConnectionPool>(config_.dbPath, config_.pool);
        auto init = pool->initialize();
        if (!init) {
            spdlog::error("Graph store unavailable: {}", init.error().message);
            return init;
        }

        auto schema = pool->withConnection([](Database& db) -> Result<int> {
            return MigrationManager(db, codeGraphMigrations()).migrate();
        });
        if (!schema) {
            spdlog::error("Graph store schema setup failed: {}", schema.error().message);
            return schema.error();
        }

        pool_ = std::move(pool);
        spdlog::info("Graph store connected: {}", config_.dbPath);
        return {};
    }

    void close() override {
        std::shared_ptr<ConnectionPool> pool;
        {
            std::lock_guard<std::mutex> lock(poolMutex_);
            pool.swap(pool_);
        }
        if (pool) {
            pool->shutdown();
            spdlog::debug("Graph store closed: {}", config_.dbPath);
        }
    }

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(poolMutex_);
        return pool_ != nullptr;
    }

    Result<void> upsertSymbol(const Symbol& symbol) override {
        return withDb([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto writer = GraphWriter::create(db);
                if (!writer)
                    return writer.error();
                return writer.value().write(symbol);
            });
        });
    }

    Result<void> upsertEdge(const Edge& edge) override {
        return withDb([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto writer = GraphWriter::create(db);
                if (!writer)
                    return writer.error();
                return writer.value().write(edge);
            });
        });
    }

    Result<void> upsertSymbols(const std::vector<Symbol>& symbols) override {
        return writeBatch(symbols);
    }

    Result<void> upsertEdges(const std::vector<Edge>& edges) override { return writeBatch(edges); }

    Result<std::optional<Symbol>> getSymbol(const std::string& id) const override {
        return withDb([&](Database& db) -> Result<std::optional<Symbol>> {
            auto stmtR = db.prepare(fmt::format("SELECT {} FROM symbols s WHERE s.id = ?",
                                                kSymbolColumns));
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, id);
            if (!b)
                return b.error();
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                return std::optional<Symbol>{};
            auto symbol = readSymbol(stmt);
            if (!symbol)
                return symbol.error();
            return std::optional<Symbol>{std::move(symbol).value()};
        });
    }

    Result<std::optional<Edge>> getEdge(const std::string& id) const override {
        return withDb([&](Database& db) -> Result<std::optional<Edge>> {
            auto stmtR =
                db.prepare(fmt::format("SELECT {} FROM edges e WHERE e.id = ?", kEdgeColumns));
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, id);
            if (!b)
                return b.error();
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                return std::optional<Edge>{};
            auto edge = readEdge(stmt);
            if (!edge)
                return edge.error();
            return std::optional<Edge>{std::move(edge).value()};
        });
    }

    Result<std::vector<Symbol>> getSymbolsByRepo(const std::string& repoId) const override {
        return querySymbols(fmt::format("SELECT {} FROM symbols s WHERE s.repo_id = ? "
                                        "ORDER BY s.file_path, s.start_line, s.start_column",
                                        kSymbolColumns),
                            repoId);
    }

    Result<std::vector<Symbol>> getSymbolsByFile(const std::string& repoId,
                                                 const std::string& filePath) const override {
        return querySymbols(
            fmt::format("SELECT {} FROM symbols s WHERE s.repo_id = ? AND s.file_path = ? "
                        "ORDER BY s.start_line, s.start_column",
                        kSymbolColumns),
            repoId, filePath);
    }

    Result<std::vector<Edge>> getEdgesByRepo(const std::string& repoId) const override {
        return withDb([&](Database& db) -> Result<std::vector<Edge>> {
            auto stmtR = db.prepare(fmt::format(
                "SELECT {} FROM edges e LEFT JOIN symbols s ON s.id = e.source_id "
                "WHERE e.repo_id = ? ORDER BY s.file_path, s.start_line, e.rowid",
                kEdgeColumns));
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, repoId);
            if (!b)
                return b.error();
            return collectRows<Edge>(stmt, readEdge);
        });
    }

    Result<CallGraph> callGraph(const std::string& repoId) const override {
        return withDb([&](Database& db) -> Result<CallGraph> {
            auto stmtR = db.prepare(R"(
                SELECT caller.name, callee.name FROM relationships r
                JOIN symbols caller ON caller.id = r.source_id
                JOIN symbols callee ON callee.id = r.target_id
                WHERE r.kind = 'calls' AND caller.repo_id = ?
                ORDER BY r.rowid
            )");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, repoId);
            if (!b)
                return b.error();

            CallGraph graph;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                graph[stmt.getString(0)].push_back(stmt.getString(1));
            }
            return graph;
        });
    }

    Result<std::vector<Symbol>> orphanSymbols(const std::string& repoId) const override {
        return querySymbols(fmt::format("SELECT {} FROM symbols s "
                                        "LEFT JOIN relationships r ON r.target_id = s.id "
                                        "WHERE s.repo_id = ? AND s.kind != 'module' "
                                        "AND r.edge_id IS NULL "
                                        "ORDER BY s.file_path, s.start_line, s.start_column",
                                        kSymbolColumns),
                            repoId);
    }

    Result<std::vector<CyclePath>> cycles(const std::string& repoId) const override {
        return withDb([&](Database& db) -> Result<std::vector<CyclePath>> {
            auto stmtR = db.prepare(R"(
                SELECT r.source_id, r.target_id, src.name, dst.name FROM relationships r
                JOIN symbols src ON src.id = r.source_id
                JOIN symbols dst ON dst.id = r.target_id
                WHERE src.repo_id = ?
            )");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, repoId);
            if (!b)
                return b.error();

            std::unordered_map<std::string, std::string> names;
            Adjacency adjacency;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto src = stmt.getString(0);
                auto dst = stmt.getString(1);
                names.emplace(src, stmt.getString(2));
                names.emplace(dst, stmt.getString(3));
                adjacency[src].insert(dst);
            }
            return CycleFinder(adjacency, names, config_).run();
        });
    }

    Result<std::vector<EndpointInfo>>
    endpointsWithoutValidation(const std::string& repoId) const override {
        return withDb([&](Database& db) -> Result<std::vector<EndpointInfo>> {
            auto stmtR = db.prepare(R"(
                SELECT s.id, s.name, s.file_path, s.start_line, s.attributes FROM symbols s
                WHERE s.repo_id = ? AND s.kind = 'function'
                  AND json_array_length(json_extract(s.attributes, '$.parameters')) > 0
                  AND NOT EXISTS (
                      SELECT 1 FROM relationships r JOIN symbols t ON t.id = r.target_id
                      WHERE r.source_id = s.id
                        AND (t.name LIKE '%validate%' OR t.name LIKE '%check%'))
                ORDER BY s.file_path, s.start_line
            )");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, repoId);
            if (!b)
                return b.error();
            return collectRows<EndpointInfo>(stmt, [](const Statement& row) -> Result<EndpointInfo> {
                EndpointInfo info;
                info.symbolId = row.getString(0);
                info.name = row.getString(1);
                info.filePath = row.getString(2);
                info.line = static_cast<std::uint32_t>(row.getInt64(3));
                auto attrs = parseAttributes(row.getString(4));
                if (auto it = attrs.find("parameters"); it != attrs.end() && it->is_array()) {
                    for (const auto& p : *it) {
                        if (p.is_string())
                            info.parameters.push_back(p.get<std::string>());
                    }
                }
                return info;
            });
        });
    }

    Result<GraphStats> stats(const std::string& repoId) const override {
        return withDb([&](Database& db) -> Result<GraphStats> {
            auto stmtR = db.prepare(R"(
                SELECT
                  (SELECT COUNT(*) FROM symbols WHERE repo_id = ?1),
                  (SELECT COUNT(*) FROM edges WHERE repo_id = ?1),
                  (SELECT COUNT(*) FROM relationships r JOIN edges e ON e.id = r.edge_id
                    WHERE e.repo_id = ?1),
                  (SELECT COUNT(*) FROM edges WHERE repo_id = ?1 AND target_id IS NULL)
            )");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bind(1, repoId);
            if (!b)
                return b.error();
            auto step = stmt.step();
            if (!step)
                return step.error();
            GraphStats out;
            out.symbols = static_cast<std::size_t>(stmt.getInt64(0));
            out.edges = static_cast<std::size_t>(stmt.getInt64(1));
            out.relationships = static_cast<std::size_t>(stmt.getInt64(2));
            out.unresolvedEdges = static_cast<std::size_t>(stmt.getInt64(3));
            return out;
        });
    }

    Result<std::string> exportDocument(const std::string& repoId,
                                       ExportFormat format) const override {
        auto symbols = getSymbolsByRepo(repoId);
        if (!symbols)
            return symbols.error();

        if (format == ExportFormat::Json) {
            auto edges = getEdgesByRepo(repoId);
            if (!edges)
                return edges.error();
            return toInterchangeJson(repoId, symbols.value(), edges.value()).dump(2);
        }

        auto relationships =
            withDb([&](Database& db) -> Result<std::vector<RelationshipRecord>> {
                auto stmtR = db.prepare(R"(
                    SELECT r.edge_id, r.source_id, r.target_id, r.kind FROM relationships r
                    JOIN symbols s ON s.id = r.source_id
                    WHERE s.repo_id = ? ORDER BY r.rowid
                )");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                auto b = stmt.bind(1, repoId);
                if (!b)
                    return b.error();
                return collectRows<RelationshipRecord>(
                    stmt, [](const Statement& row) -> Result<RelationshipRecord> {
                        auto kind = model::parseEdgeKind(row.getString(3));
                        if (!kind)
                            return kind.error();
                        return RelationshipRecord{row.getString(0), row.getString(1),
                                                  row.getString(2), kind.value()};
                    });
            });
        if (!relationships)
            return relationships.error();
        return toGraphML(repoId, symbols.value(), relationships.value());
    }

    Result<std::size_t> resolveCrossFileCalls(const std::string& repoId) override {
        return withDb([&](Database& db) -> Result<std::size_t> {
            std::size_t created = 0;
            auto tx = db.transaction([&]() -> Result<void> {
                auto pendingR = db.prepare(fmt::format(
                    "SELECT {} FROM edges e WHERE e.repo_id = ? AND e.kind = 'calls' "
                    "AND e.target_id IS NULL ORDER BY e.rowid",
                    kEdgeColumns));
                if (!pendingR)
                    return pendingR.error();
                auto pendingStmt = std::move(pendingR).value();
                auto b = pendingStmt.bind(1, repoId);
                if (!b)
                    return b;
                auto pending = collectRows<Edge>(pendingStmt, readEdge);
                if (!pending)
                    return pending.error();

                auto candidatesR = db.prepare(
                    "SELECT id FROM symbols WHERE repo_id = ? AND name = ? "
                    "AND (kind = 'method' OR (kind = 'function' AND ? = 0)) "
                    "ORDER BY file_path, start_line");
                if (!candidatesR)
                    return candidatesR.error();
                auto candidates = std::move(candidatesR).value();
                auto deleteR = db.prepare("DELETE FROM edges WHERE id = ?");
                if (!deleteR)
                    return deleteR.error();
                auto deletePlaceholder = std::move(deleteR).value();

                auto writer = GraphWriter::create(db);
                if (!writer)
                    return writer.error();

                for (const auto& placeholder : pending.value()) {
                    const auto callee = placeholder.attributes.value("callee", std::string{});
                    if (callee.empty())
                        continue;
                    const bool memberCall =
                        placeholder.attributes.value("form", std::string{}) == "attribute";

                    auto r = candidates.reset();
                    if (!r)
                        return r;
                    r = candidates.bindAll(repoId, callee, memberCall ? 1 : 0);
                    if (!r)
                        return r;
                    std::vector<std::string> targets;
                    while (true) {
                        auto step = candidates.step();
                        if (!step)
                            return step.error();
                        if (!step.value())
                            break;
                        targets.push_back(candidates.getString(0));
                    }
                    if (targets.empty())
                        continue;

                    const std::string origin = "link:" + placeholder.id;
                    for (const auto& target : targets) {
                        Edge linked = placeholder;
                        linked.targetId = target;
                        linked.id = core::stableId(
                            "edge", {repoId, "calls", placeholder.sourceId, target, origin});
                        linked.attributes["resolved_from"] = placeholder.id;
                        r = writer.value().write(linked);
                        if (!r)
                            return r;
                        ++created;
                    }

                    r = deletePlaceholder.reset();
                    if (!r)
                        return r;
                    r = deletePlaceholder.bind(1, placeholder.id);
                    if (!r)
                        return r;
                    r = deletePlaceholder.execute();
                    if (!r)
                        return r;
                }
                return {};
            });
            if (!tx)
                return tx.error();
            spdlog::debug("Linked {} cross-file calls for repo {}", created, repoId);
            return created;
        });
    }

    Result<ImportStats> importBulk(const nlohmann::json& data) override {
        if (!data.is_object()) {
            return Error{ErrorCode::InvalidData, "Import document must be a JSON object"};
        }
        std::vector<Symbol> symbols;
        std::vector<Edge> edges;
        try {
            if (auto it = data.find("symbols"); it != data.end()) {
                symbols = it->get<std::vector<Symbol>>();
            }
            if (auto it = data.find("edges"); it != data.end()) {
                edges = it->get<std::vector<Edge>>();
            }
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidData, std::string("Malformed import document: ") + e.what()};
        } catch (const std::invalid_argument& e) {
            return Error{ErrorCode::InvalidData, std::string("Malformed import document: ") + e.what()};
        }

        auto r = upsertSymbols(symbols);
        if (!r)
            return r.error();
        r = upsertEdges(edges);
        if (!r)
            return r.error();
        spdlog::info("Imported {} symbols and {} edges", symbols.size(), edges.size());
        return ImportStats{symbols.size(), edges.size()};
    }

private:
    GraphStoreConfig config_;
    mutable std::mutex poolMutex_;
    std::shared_ptr<ConnectionPool> pool_;

    std::shared_ptr<ConnectionPool> currentPool() const {
        std::lock_guard<std::mutex> lock(poolMutex_);
        return pool_;
    }

    template <typename Func>
    auto withDb(Func&& func) const -> std::invoke_result_t<Func, Database&> {
        auto pool = currentPool();
        if (!pool) {
            return Error{ErrorCode::NotConnected, "Graph store is not connected"};
        }
        return pool->withConnection(std::forward<Func>(func));
    }

    template <typename T> Result<void> writeBatch(const std::vector<T>& items) {
        if (items.empty()) {
            // Still report connectivity.
            return withDb([](Database&) -> Result<void> { return {}; });
        }
        return withDb([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto writer = GraphWriter::create(db);
                if (!writer)
                    return writer.error();
                for (const auto& item : items) {
                    auto r = writer.value().write(item);
                    if (!r)
                        return r;
                }
                return {};
            });
        });
    }

    template <typename... Params>
    Result<std::vector<Symbol>> querySymbols(const std::string& sql,
                                             const Params&... params) const {
        return withDb([&](Database& db) -> Result<std::vector<Symbol>> {
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto b = stmt.bindAll(params...);
            if (!b)
                return b.error();
            return collectRows<Symbol>(stmt, readSymbol);
        });
    }
};

std::unique_ptr<GraphStore> makeSqliteGraphStore(GraphStoreConfig config) {
    return std::make_unique<SqliteGraphStore>(std::move(config));
}

} // namespace codegraph::graph
