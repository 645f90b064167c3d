#include <gtest/gtest.h>
#include <codegraph/graph/graph_store.h>

#include <atomic>
#include <filesystem>
#include <thread>

#include "common/graph_fixtures.h"

using namespace codegraph;
using namespace codegraph::graph;
using namespace codegraph::test;
using model::EdgeKind;
using model::SymbolKind;

class GraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = makeTempDir("graph-store");
        GraphStoreConfig config;
        config.dbPath = (dir_ / "graph.db").string();
        store_ = makeSqliteGraphStore(config);
        auto r = store_->connect();
        ASSERT_TRUE(r.has_value()) << r.error().message;
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    GraphStats statsFor(const std::string& repo = "repo") {
        auto s = store_->stats(repo);
        EXPECT_TRUE(s.has_value());
        return s ? s.value() : GraphStats{};
    }

    std::filesystem::path dir_;
    std::unique_ptr<GraphStore> store_;
};

TEST(GraphStoreConnectionTest, OperationsBeforeConnectReportNotConnected) {
    GraphStoreConfig config;
    config.dbPath = ":memory:";
    auto store = makeSqliteGraphStore(config);
    EXPECT_FALSE(store->isConnected());

    auto write = store->upsertSymbol(makeFunction("s1", "f", "a.py", 1));
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().code, ErrorCode::NotConnected);

    auto read = store->getSymbol("s1");
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, ErrorCode::NotConnected);

    // Empty batches still check connectivity
    auto batch = store->upsertEdges({});
    ASSERT_FALSE(batch);
    EXPECT_EQ(batch.error().code, ErrorCode::NotConnected);
}

TEST(GraphStoreConnectionTest, UnreachableDatabaseIsServiceUnavailable) {
    GraphStoreConfig config;
    config.dbPath = "/nonexistent-codegraph-dir/deeper/graph.db";
    auto store = makeSqliteGraphStore(config);
    auto r = store->connect();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ServiceUnavailable);
    EXPECT_FALSE(store->isConnected());
}

TEST(GraphStoreConnectionTest, EmptyPathIsInvalidArgument) {
    auto store = makeSqliteGraphStore(GraphStoreConfig{});
    auto r = store->connect();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(GraphStoreConnectionTest, InMemoryStoreConnectsAndCloses) {
    GraphStoreConfig config;
    config.dbPath = ":memory:";
    auto store = makeSqliteGraphStore(config);
    ASSERT_TRUE(store->connect());
    ASSERT_TRUE(store->connect()); // second connect is a no-op
    EXPECT_TRUE(store->isConnected());
    ASSERT_TRUE(store->upsertSymbol(makeFunction("s1", "f", "a.py", 1)));

    store->close();
    EXPECT_FALSE(store->isConnected());
    auto after = store->getSymbolsByRepo("repo");
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, ErrorCode::NotConnected);
    store->close(); // idempotent
}

TEST_F(GraphStoreTest, SymbolUpsertIsIdempotentAndMerges) {
    auto sym = makeFunction("s1", "handler", "api.py", 10, {"request"});
    ASSERT_TRUE(store_->upsertSymbol(sym));
    ASSERT_TRUE(store_->upsertSymbol(sym));
    EXPECT_EQ(statsFor().symbols, 1u);

    sym.docstring = "Handle a request.";
    sym.span.startLine = 12;
    ASSERT_TRUE(store_->upsertSymbol(sym));
    EXPECT_EQ(statsFor().symbols, 1u);

    auto stored = store_->getSymbol("s1");
    ASSERT_TRUE(stored);
    ASSERT_TRUE(stored.value().has_value());
    const auto& s = *stored.value();
    EXPECT_EQ(s.name, "handler");
    EXPECT_EQ(s.docstring, std::optional<std::string>("Handle a request."));
    EXPECT_EQ(s.span.startLine, 12u);
    EXPECT_EQ(s.attributes["parameters"], nlohmann::json::array({"request"}));
    EXPECT_EQ(s.repoId, "repo");
}

TEST_F(GraphStoreTest, MissingLookupsReturnEmpty) {
    auto sym = store_->getSymbol("nope");
    ASSERT_TRUE(sym);
    EXPECT_FALSE(sym.value().has_value());

    auto edge = store_->getEdge("nope");
    ASSERT_TRUE(edge);
    EXPECT_FALSE(edge.value().has_value());
}

TEST_F(GraphStoreTest, EdgeBetweenStoredSymbolsBecomesRelationship) {
    ASSERT_TRUE(store_->upsertSymbol(makeFunction("a", "caller", "a.py", 1)));
    ASSERT_TRUE(store_->upsertSymbol(makeFunction("b", "callee", "a.py", 5)));
    ASSERT_TRUE(store_->upsertEdge(makeEdge("e1", "a", "b", EdgeKind::Calls)));
    ASSERT_TRUE(store_->upsertEdge(makeEdge("e1", "a", "b", EdgeKind::Calls)));

    auto stats = statsFor();
    EXPECT_EQ(stats.edges, 1u);
    EXPECT_EQ(stats.relationships, 1u);

    auto edge = store_->getEdge("e1");
    ASSERT_TRUE(edge);
    ASSERT_TRUE(edge.value().has_value());
    EXPECT_EQ(edge.value()->targetId, std::optional<std::string>("b"));
    EXPECT_EQ(edge.value()->kind, EdgeKind::Calls);
}

TEST_F(GraphStoreTest, EdgeStoredBeforeEndpointsMaterializesLater) {
    ASSERT_TRUE(store_->upsertEdge(makeEdge("e1", "a", "b", EdgeKind::Calls)));
    EXPECT_EQ(statsFor().relationships, 0u);

    ASSERT_TRUE(store_->upsertSymbol(makeFunction("a", "caller", "a.py", 1)));
    EXPECT_EQ(statsFor().relationships, 0u);

    ASSERT_TRUE(store_->upsertSymbol(makeFunction("b", "callee", "b.py", 1)));
    EXPECT_EQ(statsFor().relationships, 1u);

    auto graph = store_->callGraph("repo");
    ASSERT_TRUE(graph);
    ASSERT_EQ(graph.value().count("caller"), 1u);
    EXPECT_EQ(graph.value().at("caller"), std::vector<std::string>{"callee"});
}

TEST_F(GraphStoreTest, EdgeWithoutTargetIsStoredButNotMaterialized) {
    ASSERT_TRUE(store_->upsertSymbol(makeFunction("a", "main", "a.py", 1)));
    ASSERT_TRUE(store_->upsertEdge(makeCallPlaceholder("e1", "a", "print")));

    auto stats = statsFor();
    EXPECT_EQ(stats.edges, 1u);
    EXPECT_EQ(stats.relationships, 0u);
    EXPECT_EQ(stats.unresolvedEdges, 1u);

    auto edge = store_->getEdge("e1");
    ASSERT_TRUE(edge);
    ASSERT_TRUE(edge.value().has_value());
    EXPECT_FALSE(edge.value()->isResolved());
    EXPECT_EQ(edge.value()->attributes["callee"], "print");
}

TEST_F(GraphStoreTest, RetargetingEdgeToMissingSymbolDropsRelationship) {
    ASSERT_TRUE(store_->upsertSymbol(makeFunction("a", "f", "a.py", 1)));
    ASSERT_TRUE(store_->upsertSymbol(makeFunction("b", "g", "a.py", 5)));
    ASSERT_TRUE(store_->upsertEdge(makeEdge("e1", "a", "b", EdgeKind::Calls)));
    EXPECT_EQ(statsFor().relationships, 1u);

    ASSERT_TRUE(store_->upsertEdge(makeEdge("e1", "a", "ghost", EdgeKind::Calls)));
    EXPECT_EQ(statsFor().relationships, 0u);
    EXPECT_EQ(statsFor().edges, 1u);
}

TEST_F(GraphStoreTest, SelfEdgeMaterializes) {
    ASSERT_TRUE(store_->upsertSymbol(makeFunction("a", "recurse", "a.py", 1)));
    ASSERT_TRUE(store_->upsertEdge(makeEdge("e1", "a", "a", EdgeKind::Calls)));
    EXPECT_EQ(statsFor().relationships, 1u);
}

TEST_F(GraphStoreTest, BatchUpsertsApplyInOrder) {
    std::vector<model::Symbol> symbols{makeFunction("a", "one", "a.py", 1),
                                       makeFunction("b", "two", "a.py", 5),
                                       makeSymbol("c", "Three", SymbolKind::Class, "b.py", 1)};
    std::vector<model::Edge> edges{makeEdge("e1", "a", "b", EdgeKind::Calls),
                                   makeEdge("e2", "c", "a", EdgeKind::Contains),
                                   makeCallPlaceholder("e3", "b", "print")};
    ASSERT_TRUE(store_->upsertSymbols(symbols));
    ASSERT_TRUE(store_->upsertEdges(edges));

    auto stats = statsFor();
    EXPECT_EQ(stats.symbols, 3u);
    EXPECT_EQ(stats.edges, 3u);
    EXPECT_EQ(stats.relationships, 2u);

    auto byFile = store_->getSymbolsByFile("repo", "a.py");
    ASSERT_TRUE(byFile);
    ASSERT_EQ(byFile.value().size(), 2u);
    EXPECT_EQ(byFile.value()[0].name, "one");
    EXPECT_EQ(byFile.value()[1].name, "two");

    auto all = store_->getSymbolsByRepo("repo");
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value().back().name, "Three");

    // Repositories are isolated
    auto other = store_->getSymbolsByRepo("other");
    ASSERT_TRUE(other);
    EXPECT_TRUE(other.value().empty());
}

TEST_F(GraphStoreTest, ConcurrentWritersConverge) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                // Every thread writes the same identities
                auto id = "s" + std::to_string(i);
                if (!store_->upsertSymbol(
                        makeFunction(id, "f" + std::to_string(i), "a.py",
                                     static_cast<std::uint32_t>(i + 1))))
                    ++failures;
            }
        });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(statsFor().symbols, static_cast<std::size_t>(kPerThread));
}

TEST_F(GraphStoreTest, CrossFileCallsAreLinkedByName) {
    // a.py: class Foo with method bar; b.py: function baz calling bar()
    auto foo = makeSymbol("foo", "Foo", SymbolKind::Class, "a.py", 1);
    auto bar = makeSymbol("bar", "bar", SymbolKind::Method, "a.py", 2);
    bar.parentId = "foo";
    auto baz = makeFunction("baz", "baz", "b.py", 1);
    auto helper = makeFunction("helper", "helper", "c.py", 1);
    ASSERT_TRUE(store_->upsertSymbols({foo, bar, baz, helper}));
    ASSERT_TRUE(store_->upsertEdges({makeEdge("contains", "foo", "bar", EdgeKind::Contains),
                                     makeCallPlaceholder("p1", "baz", "bar"),
                                     makeCallPlaceholder("p2", "baz", "helper", true),
                                     makeCallPlaceholder("p3", "baz", "print")}));

    auto created = store_->resolveCrossFileCalls("repo");
    ASSERT_TRUE(created) << created.error().message;
    EXPECT_EQ(created.value(), 1u);

    auto graph = store_->callGraph("repo");
    ASSERT_TRUE(graph);
    ASSERT_EQ(graph.value().size(), 1u);
    EXPECT_EQ(graph.value().at("baz"), std::vector<std::string>{"bar"});

    // Matched placeholder replaced; attribute call to a plain function and
    // the builtin stay unresolved
    auto p1 = store_->getEdge("p1");
    ASSERT_TRUE(p1);
    EXPECT_FALSE(p1.value().has_value());
    auto stats = statsFor();
    EXPECT_EQ(stats.unresolvedEdges, 2u);

    auto edges = store_->getEdgesByRepo("repo");
    ASSERT_TRUE(edges);
    bool foundLinked = false;
    for (const auto& e : edges.value()) {
        if (e.kind == EdgeKind::Calls && e.isResolved()) {
            foundLinked = true;
            EXPECT_EQ(e.attributes["resolved_from"], "p1");
            EXPECT_EQ(e.attributes["callee"], "bar");
        }
    }
    EXPECT_TRUE(foundLinked);

    // Nothing left to link
    auto again = store_->resolveCrossFileCalls("repo");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(GraphStoreTest, CallToOverloadedNameLinksEveryCandidate) {
    ASSERT_TRUE(store_->upsertSymbols({makeFunction("caller", "main", "m.py", 1),
                                       makeFunction("run1", "run", "a.py", 1),
                                       makeSymbol("run2", "run", SymbolKind::Method, "b.py", 4)}));
    ASSERT_TRUE(store_->upsertEdge(makeCallPlaceholder("p", "caller", "run")));

    auto created = store_->resolveCrossFileCalls("repo");
    ASSERT_TRUE(created);
    EXPECT_EQ(created.value(), 2u);

    auto graph = store_->callGraph("repo");
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph.value().at("main").size(), 2u);
}
