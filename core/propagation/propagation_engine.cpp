#include "propagation/propagation_engine.hpp"
#include "common/errors.hpp"
#include "model/message.hpp"

#include <cmath>
#include <string>

namespace ideodrift {

const char* toString(TransmissionState state) {
    switch (state) {
        case TransmissionState::Continuing: return "continuing";
        case TransmissionState::Saturated:  return "saturated";
    }
    return "unknown";
}

PropagationRun PropagationEngine::propagate(const Network& network,
                                            uint64_t source_id,
                                            uint64_t target_id,
                                            double sensitivity) const {
    validateSensitivity(sensitivity);
    const IdeologyNode& source = network.node(source_id);
    if (!network.hasNode(target_id)) {
        throw ValidationError("Unknown target node: " + std::to_string(target_id));
    }

    PropagationRun run;
    run.sensitivity = sensitivity;
    run.path = network.graph().shortestPath(source_id, target_id);

    Message message(source.ideologyScore());
    run.initial_message_ideology = message.ideology_score;

    double fidelity_drift = 0.0;
    double plausibility_drift = 0.0;
    const size_t path_length = run.path.size();

    for (size_t i = 0; i + 1 < path_length; i++) {
        const IdeologyNode& current = network.node(run.path[i]);
        const uint64_t next_id = run.path[i + 1];

        double before = message.ideology_score;
        double after = current.transform(before, sensitivity);
        message.ideology_score = after;

        if (message.saturated()) {
            run.state = TransmissionState::Saturated;
        }

        run.traversals.push_back({current.id(), next_id, after});

        if (i > 0) {
            double node_drift = after - before;
            fidelity_drift += std::abs(node_drift);
            plausibility_drift += node_drift;

            PropagationResult record;
            record.hop_index = i;
            record.node_id = current.id();
            record.path_length = path_length;
            record.initial_message_ideology = run.initial_message_ideology;
            record.node_ideology = current.ideologyScore();
            record.sensitivity = sensitivity;
            record.bias_multiplier = current.biasMultiplier();
            record.ideology_before = before;
            record.ideology_after = after;
            record.fidelity_drift = fidelity_drift;
            record.plausibility_drift = plausibility_drift;
            record.state = run.state;
            run.records.push_back(record);
        }

        if (run.state == TransmissionState::Saturated) break;
    }

    run.final_message_ideology = message.ideology_score;
    return run;
}

} // namespace ideodrift
