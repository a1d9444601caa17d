#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ideodrift {

// ─── Graph ─────────────────────────────────────────────────────
// Purely structural directed graph: node ids, attributes and edges.
// Adjacency-list backed by unordered_maps for O(1) access.
// Simulation results are never written back into it.

class Graph {
public:
    Graph() = default;

    // ── Node operations ──
    uint64_t addNode();
    uint64_t addNodeWithId(uint64_t id,
                           const std::unordered_map<std::string, std::string>& attributes = {});
    const Node* getNode(uint64_t id) const;
    bool hasNode(uint64_t id) const { return nodes_.count(id) > 0; }
    std::vector<uint64_t> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    uint64_t addEdge(uint64_t source, uint64_t target);
    const Edge* getEdge(uint64_t id) const;
    /// Edge id of source → target, or 0 if there is none.
    uint64_t findEdge(uint64_t source, uint64_t target) const;
    std::vector<uint64_t> getEdgeIds() const;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    std::vector<uint64_t> getOutgoing(uint64_t node_id) const;
    /// Targets of outgoing edges, sorted ascending.
    std::vector<uint64_t> getSuccessors(uint64_t node_id) const;

    // ── Path queries ──

    /// Unweighted shortest directed path, both endpoints included.
    /// Successors are expanded in ascending id order so ties resolve
    /// deterministically. Throws NoPathError if target is unreachable,
    /// std::runtime_error if either endpoint is unknown.
    std::vector<uint64_t> shortestPath(uint64_t source, uint64_t target) const;

    // ── Iteration ──
    void forEachNode(std::function<void(const Node&)> fn) const;
    void forEachEdge(std::function<void(const Edge&)> fn) const;

private:
    uint64_t next_node_id_ = 0;
    uint64_t next_edge_id_ = 1;

    std::unordered_map<uint64_t, Node> nodes_;
    std::unordered_map<uint64_t, Edge> edges_;

    // Adjacency lists: node_id → set of edge_ids
    std::unordered_map<uint64_t, std::unordered_set<uint64_t>> outgoing_;
};

} // namespace ideodrift
