#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "common/errors.hpp"

#include <stdexcept>

using namespace ideodrift;

// ─── Basic Node/Edge CRUD ──────────────────────────────────────

TEST(GraphTest, AddAndGetNode) {
    Graph g;
    uint64_t id = g.addNodeWithId(7, {{"ideology_score", "0.5"}});
    ASSERT_EQ(g.nodeCount(), 1);
    const Node* n = g.getNode(id);
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->id, 7u);
    EXPECT_EQ(n->getAttribute("ideology_score"), "0.5");
    EXPECT_FALSE(n->hasAttribute("nonexistent"));
}

TEST(GraphTest, AutoIdsSkipTakenIds) {
    Graph g;
    EXPECT_EQ(g.addNode(), 0u);
    g.addNodeWithId(5);
    EXPECT_EQ(g.addNode(), 6u);
}

TEST(GraphTest, DuplicateNodeIdThrows) {
    Graph g;
    g.addNodeWithId(1);
    EXPECT_THROW(g.addNodeWithId(1), std::runtime_error);
}

TEST(GraphTest, UnknownIdsLookUpAsNull) {
    Graph g;
    g.addNodeWithId(1);
    EXPECT_EQ(g.getNode(2), nullptr);
    EXPECT_EQ(g.getEdge(1), nullptr);
    EXPECT_TRUE(g.getSuccessors(1).empty());
    EXPECT_TRUE(g.getOutgoing(42).empty());
}

TEST(GraphTest, AddAndGetEdge) {
    Graph g;
    uint64_t n1 = g.addNode();
    uint64_t n2 = g.addNode();
    uint64_t eid = g.addEdge(n1, n2);
    ASSERT_EQ(g.edgeCount(), 1);
    const Edge* e = g.getEdge(eid);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->source, n1);
    EXPECT_EQ(e->target, n2);
    EXPECT_EQ(g.findEdge(n1, n2), eid);
    EXPECT_EQ(g.findEdge(n2, n1), 0u);  // directed
}

TEST(GraphTest, ParallelEdgeIsIgnored) {
    Graph g;
    uint64_t n1 = g.addNode();
    uint64_t n2 = g.addNode();
    uint64_t first = g.addEdge(n1, n2);
    EXPECT_EQ(g.addEdge(n1, n2), first);
    EXPECT_EQ(g.edgeCount(), 1);
}

TEST(GraphTest, EdgeToUnknownNodeThrows) {
    Graph g;
    uint64_t n1 = g.addNode();
    EXPECT_THROW(g.addEdge(n1, 99), std::runtime_error);
    EXPECT_THROW(g.addEdge(99, n1), std::runtime_error);
}

// ─── Adjacency Queries ────────────────────────────────────────

TEST(GraphTest, AdjacencyQueries) {
    Graph g;
    uint64_t n1 = g.addNode();
    uint64_t n2 = g.addNode();
    uint64_t n3 = g.addNode();
    g.addEdge(n1, n3);
    g.addEdge(n1, n2);
    g.addEdge(n3, n1);

    EXPECT_EQ(g.getOutgoing(n1).size(), 2);

    auto successors = g.getSuccessors(n1);
    ASSERT_EQ(successors.size(), 2);
    EXPECT_EQ(successors[0], n2);  // sorted
    EXPECT_EQ(successors[1], n3);
}

// ─── Shortest Path ────────────────────────────────────────────

TEST(GraphTest, ShortestPathOnChain) {
    Graph g;
    for (uint64_t i = 0; i < 5; i++) {
        g.addNodeWithId(i);
        if (i > 0) g.addEdge(i - 1, i);
    }
    auto path = g.shortestPath(0, 4);
    EXPECT_EQ(path, (std::vector<uint64_t>{0, 1, 2, 3, 4}));
}

TEST(GraphTest, ShortestPathTakesShortcut) {
    Graph g;
    for (uint64_t i = 0; i < 4; i++) g.addNodeWithId(i);
    g.addEdge(0, 1);
    g.addEdge(1, 2);
    g.addEdge(2, 3);
    g.addEdge(0, 2);
    EXPECT_EQ(g.shortestPath(0, 3), (std::vector<uint64_t>{0, 2, 3}));
}

TEST(GraphTest, ShortestPathTieBreaksOnLowestId) {
    Graph g;
    for (uint64_t i = 0; i < 4; i++) g.addNodeWithId(i);
    g.addEdge(0, 2);
    g.addEdge(0, 1);
    g.addEdge(2, 3);
    g.addEdge(1, 3);
    EXPECT_EQ(g.shortestPath(0, 3), (std::vector<uint64_t>{0, 1, 3}));
}

TEST(GraphTest, ShortestPathToSelf) {
    Graph g;
    g.addNodeWithId(3);
    EXPECT_EQ(g.shortestPath(3, 3), (std::vector<uint64_t>{3}));
}

TEST(GraphTest, ShortestPathRespectsDirection) {
    Graph g;
    g.addNodeWithId(0);
    g.addNodeWithId(1);
    g.addEdge(0, 1);
    EXPECT_THROW(g.shortestPath(1, 0), NoPathError);
}

TEST(GraphTest, ShortestPathDisconnectedThrowsNoPath) {
    Graph g;
    g.addNodeWithId(0);
    g.addNodeWithId(1);
    try {
        g.shortestPath(0, 1);
        FAIL() << "expected NoPathError";
    } catch (const NoPathError& e) {
        EXPECT_EQ(e.source(), 0u);
        EXPECT_EQ(e.target(), 1u);
    }
}

TEST(GraphTest, ShortestPathUnknownEndpointThrows) {
    Graph g;
    g.addNodeWithId(0);
    EXPECT_THROW(g.shortestPath(0, 42), std::runtime_error);
}

// ─── Iteration ─────────────────────────────────────────────────

TEST(GraphTest, IterationIsOrderedById) {
    Graph g;
    g.addNodeWithId(9);
    g.addNodeWithId(2);
    g.addNodeWithId(5);

    std::vector<uint64_t> seen;
    g.forEachNode([&](const Node& n) { seen.push_back(n.id); });
    EXPECT_EQ(seen, (std::vector<uint64_t>{2, 5, 9}));
}
