#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace ideodrift {

/// A vertex in the structural directed graph.
/// Carries only an id and free-form string attributes; simulation state
/// lives in the Network, never here.
struct Node {
    uint64_t id = 0;
    std::unordered_map<std::string, std::string> attributes;

    Node() = default;
    explicit Node(uint64_t id) : id(id) {}

    std::string getAttribute(const std::string& key, const std::string& default_val = "") const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : default_val;
    }

    bool hasAttribute(const std::string& key) const {
        return attributes.count(key) > 0;
    }
};

} // namespace ideodrift
