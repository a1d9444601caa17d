#pragma once

#include "network/network.hpp"
#include "propagation/propagation_result.hpp"

#include <cstdint>

namespace ideodrift {

// ─── Propagation Engine ────────────────────────────────────────
// Sequential fold of a message over the shortest path between two nodes.
//
// Per hop: the current node transforms the message, the edge it leaves by
// records the carried value, and from hop 1 onward the cumulative fidelity
// (sum of |change|) and plausibility (sum of signed change) drift are
// reported. A message that lands exactly on 0 or 1 saturates the run; the
// triggering hop is still recorded and the walk stops there.

class PropagationEngine {
public:
    PropagationEngine() = default;

    /// Throws ValidationError for unknown endpoints or sensitivity <= 0,
    /// NoPathError if target is unreachable from source.
    PropagationRun propagate(const Network& network,
                             uint64_t source_id,
                             uint64_t target_id,
                             double sensitivity) const;
};

} // namespace ideodrift
