#include "graph/graph.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace ideodrift {

// ─── Node operations ───────────────────────────────────────────

uint64_t Graph::addNode() {
    while (nodes_.count(next_node_id_)) {
        next_node_id_++;
    }
    return addNodeWithId(next_node_id_);
}

uint64_t Graph::addNodeWithId(uint64_t id,
                              const std::unordered_map<std::string, std::string>& attributes) {
    if (nodes_.count(id)) {
        throw std::runtime_error("Node ID already exists: " + std::to_string(id));
    }
    Node node(id);
    node.attributes = attributes;
    nodes_.emplace(id, std::move(node));
    outgoing_[id];  // ensure entry exists
    if (id >= next_node_id_) {
        next_node_id_ = id + 1;
    }
    return id;
}

const Node* Graph::getNode(uint64_t id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<uint64_t> Graph::getNodeIds() const {
    std::vector<uint64_t> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Edge operations ───────────────────────────────────────────

uint64_t Graph::addEdge(uint64_t source, uint64_t target) {
    if (!nodes_.count(source))
        throw std::runtime_error("Source node not found: " + std::to_string(source));
    if (!nodes_.count(target))
        throw std::runtime_error("Target node not found: " + std::to_string(target));

    // A directed graph holds at most one edge per ordered pair.
    uint64_t existing = findEdge(source, target);
    if (existing != 0) return existing;

    uint64_t id = next_edge_id_++;
    edges_.emplace(id, Edge(id, source, target));
    outgoing_[source].insert(id);
    return id;
}

const Edge* Graph::getEdge(uint64_t id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

uint64_t Graph::findEdge(uint64_t source, uint64_t target) const {
    auto it = outgoing_.find(source);
    if (it == outgoing_.end()) return 0;
    for (uint64_t eid : it->second) {
        const Edge* e = getEdge(eid);
        if (e && e->target == target) return eid;
    }
    return 0;
}

std::vector<uint64_t> Graph::getEdgeIds() const {
    std::vector<uint64_t> ids;
    ids.reserve(edges_.size());
    for (const auto& [id, _] : edges_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<uint64_t> Graph::getOutgoing(uint64_t node_id) const {
    auto it = outgoing_.find(node_id);
    if (it == outgoing_.end()) return {};
    return std::vector<uint64_t>(it->second.begin(), it->second.end());
}

std::vector<uint64_t> Graph::getSuccessors(uint64_t node_id) const {
    std::vector<uint64_t> successors;
    for (auto eid : getOutgoing(node_id)) {
        const Edge* e = getEdge(eid);
        if (e) successors.push_back(e->target);
    }
    std::sort(successors.begin(), successors.end());
    return successors;
}

// ─── Path queries ─────────────────────────────────────────────

std::vector<uint64_t> Graph::shortestPath(uint64_t source, uint64_t target) const {
    if (!nodes_.count(source))
        throw std::runtime_error("Source node not found: " + std::to_string(source));
    if (!nodes_.count(target))
        throw std::runtime_error("Target node not found: " + std::to_string(target));

    if (source == target) return {source};

    // BFS, remembering the predecessor of every discovered node
    std::unordered_map<uint64_t, uint64_t> parent;
    std::unordered_set<uint64_t> visited{source};
    std::deque<uint64_t> frontier{source};
    bool found = false;

    while (!frontier.empty() && !found) {
        uint64_t current = frontier.front();
        frontier.pop_front();
        for (uint64_t next : getSuccessors(current)) {
            if (!visited.insert(next).second) continue;
            parent[next] = current;
            if (next == target) {
                found = true;
                break;
            }
            frontier.push_back(next);
        }
    }

    if (!found) throw NoPathError(source, target);

    std::vector<uint64_t> path{target};
    uint64_t current = target;
    while (current != source) {
        current = parent.at(current);
        path.push_back(current);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(std::function<void(const Node&)> fn) const {
    for (uint64_t id : getNodeIds()) {
        fn(nodes_.at(id));
    }
}

void Graph::forEachEdge(std::function<void(const Edge&)> fn) const {
    for (uint64_t id : getEdgeIds()) {
        fn(edges_.at(id));
    }
}

} // namespace ideodrift
