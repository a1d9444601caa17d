#include "model/ideology_node.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ideodrift {

void validateIdeology(double value, const char* what) {
    if (!(value >= 0.0 && value <= 1.0)) {
        std::ostringstream ss;
        ss << what << " must be in [0,1], got " << value;
        throw ValidationError(ss.str());
    }
}

void validateSensitivity(double sensitivity) {
    if (!std::isfinite(sensitivity) || sensitivity <= 0.0) {
        std::ostringstream ss;
        ss << "Sensitivity must be a finite positive number, got " << sensitivity;
        throw ValidationError(ss.str());
    }
}

IdeologyNode::IdeologyNode(uint64_t id, double ideology_score, double bias_multiplier)
    : id_(id), ideology_score_(ideology_score), bias_multiplier_(bias_multiplier) {
    validateIdeology(ideology_score, "Ideology score");
    if (!std::isfinite(bias_multiplier) || bias_multiplier <= 0.0) {
        std::ostringstream ss;
        ss << "Bias multiplier of node " << id << " must be a finite positive number, got "
           << bias_multiplier;
        throw ValidationError(ss.str());
    }
}

double IdeologyNode::transform(double incoming_ideology, double sensitivity) const {
    validateIdeology(incoming_ideology, "Incoming message ideology");
    validateSensitivity(sensitivity);

    double delta = std::abs(ideology_score_ - incoming_ideology);
    double drift = bias_multiplier_ * sensitivity * delta * delta;

    double outgoing = ideology_score_ > incoming_ideology
        ? incoming_ideology + drift
        : incoming_ideology - drift;

    return std::clamp(outgoing, 0.0, 1.0);
}

} // namespace ideodrift
