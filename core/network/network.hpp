#pragma once

#include "graph/graph.hpp"
#include "model/ideology_node.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>

namespace ideodrift {

// ─── Network ───────────────────────────────────────────────────
// Pairs the structural Graph with the IdeologyNode placed at each id.
// Random draws always come from a caller-supplied generator.

class Network {
public:
    Network() = default;

    /// Add a node with a uniformly drawn ideology in [0,1) and link it from
    /// the previously added node (if any).
    const IdeologyNode& addNode(uint64_t id, double bias_multiplier, std::mt19937& rng);

    /// Add a node with an explicit ideology, linked from the previously
    /// added node (if any).
    const IdeologyNode& addNodeWithIdeology(uint64_t id, double ideology_score,
                                            double bias_multiplier);

    /// Add a node without linking it to anything.
    const IdeologyNode& addDetachedNode(uint64_t id, double ideology_score,
                                        double bias_multiplier);

    void addEdge(uint64_t source, uint64_t target);
    void addEdgeFromLastNode(uint64_t target);

    const IdeologyNode& node(uint64_t id) const;
    bool hasNode(uint64_t id) const { return nodes_.count(id) > 0; }
    std::optional<uint64_t> lastNodeAdded() const { return last_node_added_; }

    const Graph& graph() const { return graph_; }
    size_t size() const { return nodes_.size(); }

    /// Chain 0 → 1 → ... → node_count-1 with biases drawn from
    /// [bias_min, bias_max] and ideologies drawn from [0,1).
    static Network buildChain(size_t node_count, double bias_min, double bias_max,
                              std::mt19937& rng);

private:
    const IdeologyNode& insert(uint64_t id, double ideology_score,
                               double bias_multiplier, bool link_from_last);

    Graph graph_;
    std::map<uint64_t, IdeologyNode> nodes_;
    std::optional<uint64_t> last_node_added_;
};

} // namespace ideodrift
