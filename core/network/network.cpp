#include "network/network.hpp"
#include "common/errors.hpp"

#include <iomanip>
#include <sstream>

namespace ideodrift {

namespace {

std::string formatScore(double value) {
    std::ostringstream ss;
    ss << std::setprecision(17) << value;
    return ss.str();
}

} // namespace

const IdeologyNode& Network::addNode(uint64_t id, double bias_multiplier, std::mt19937& rng) {
    std::uniform_real_distribution<double> ideology(0.0, 1.0);
    return insert(id, ideology(rng), bias_multiplier, true);
}

const IdeologyNode& Network::addNodeWithIdeology(uint64_t id, double ideology_score,
                                                 double bias_multiplier) {
    return insert(id, ideology_score, bias_multiplier, true);
}

const IdeologyNode& Network::addDetachedNode(uint64_t id, double ideology_score,
                                             double bias_multiplier) {
    return insert(id, ideology_score, bias_multiplier, false);
}

const IdeologyNode& Network::insert(uint64_t id, double ideology_score,
                                    double bias_multiplier, bool link_from_last) {
    if (nodes_.count(id)) {
        throw ValidationError("Node ID already exists: " + std::to_string(id));
    }

    // Validate before touching the graph so a rejected node leaves no trace.
    IdeologyNode node(id, ideology_score, bias_multiplier);

    graph_.addNodeWithId(id, {
        {"ideology_score", formatScore(ideology_score)},
        {"bias_multiplier", formatScore(bias_multiplier)},
    });
    auto it = nodes_.emplace(id, node).first;

    if (link_from_last && last_node_added_) {
        graph_.addEdge(*last_node_added_, id);
    }
    last_node_added_ = id;
    return it->second;
}

void Network::addEdge(uint64_t source, uint64_t target) {
    if (!hasNode(source))
        throw ValidationError("Unknown source node: " + std::to_string(source));
    if (!hasNode(target))
        throw ValidationError("Unknown target node: " + std::to_string(target));
    graph_.addEdge(source, target);
}

void Network::addEdgeFromLastNode(uint64_t target) {
    if (!last_node_added_) {
        throw ValidationError("Network has no nodes to link from");
    }
    addEdge(*last_node_added_, target);
}

const IdeologyNode& Network::node(uint64_t id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw ValidationError("Unknown node: " + std::to_string(id));
    }
    return it->second;
}

Network Network::buildChain(size_t node_count, double bias_min, double bias_max,
                            std::mt19937& rng) {
    if (!(bias_min > 0.0) || !(bias_min <= bias_max)) {
        std::ostringstream ss;
        ss << "Bias range must satisfy 0 < min <= max, got [" << bias_min << ", "
           << bias_max << "]";
        throw ValidationError(ss.str());
    }

    Network network;
    std::uniform_real_distribution<double> bias(bias_min, bias_max);
    for (size_t i = 0; i < node_count; i++) {
        double b = bias(rng);
        network.addNode(static_cast<uint64_t>(i), b, rng);
    }
    return network;
}

} // namespace ideodrift
