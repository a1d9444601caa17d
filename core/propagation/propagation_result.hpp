#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ideodrift {

/// Terminal condition of a propagation run. Saturated is absorbing.
enum class TransmissionState {
    Continuing,
    Saturated
};

const char* toString(TransmissionState state);

// ─── PropagationResult ─────────────────────────────────────────
// One observable hop. Hop 0 (the source's own outgoing hop) is never
// reported, so hop_index starts at 1.

struct PropagationResult {
    size_t hop_index = 0;
    uint64_t node_id = 0;
    size_t path_length = 0;
    double initial_message_ideology = 0.0;
    double node_ideology = 0.0;
    double sensitivity = 0.0;
    double bias_multiplier = 0.0;
    double ideology_before = 0.0;
    double ideology_after = 0.0;
    double fidelity_drift = 0.0;       // cumulative |change|
    double plausibility_drift = 0.0;   // cumulative signed change
    TransmissionState state = TransmissionState::Continuing;

    bool transmissionSuccess() const { return state == TransmissionState::Continuing; }
};

/// Message value that crossed one edge of the path.
struct EdgeTraversal {
    uint64_t source = 0;
    uint64_t target = 0;
    double carried_ideology = 0.0;
};

// ─── PropagationRun ────────────────────────────────────────────
// Everything one call to PropagationEngine::propagate produced.

struct PropagationRun {
    std::vector<uint64_t> path;
    double sensitivity = 0.0;
    double initial_message_ideology = 0.0;
    double final_message_ideology = 0.0;
    TransmissionState state = TransmissionState::Continuing;
    std::vector<PropagationResult> records;
    std::vector<EdgeTraversal> traversals;

    bool saturated() const { return state == TransmissionState::Saturated; }
    /// True when the message crossed every edge of the path.
    bool reachedTarget() const {
        return !path.empty() && traversals.size() + 1 == path.size();
    }
};

} // namespace ideodrift
