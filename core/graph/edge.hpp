#pragma once

#include <cstdint>

namespace ideodrift {

/// A directed edge source → target.
struct Edge {
    uint64_t id = 0;
    uint64_t source = 0;
    uint64_t target = 0;

    Edge() = default;
    Edge(uint64_t id, uint64_t source, uint64_t target)
        : id(id), source(source), target(target) {}
};

} // namespace ideodrift
