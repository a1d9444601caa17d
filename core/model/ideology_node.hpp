#pragma once

#include <cstdint>

namespace ideodrift {

/// A network participant with a fixed stance and distortion strength.
/// Immutable once constructed.
class IdeologyNode {
public:
    /// Throws ValidationError if ideology_score is outside [0,1] or
    /// bias_multiplier is not a finite positive number.
    IdeologyNode(uint64_t id, double ideology_score, double bias_multiplier);

    uint64_t id() const { return id_; }
    double ideologyScore() const { return ideology_score_; }
    double biasMultiplier() const { return bias_multiplier_; }

    /// Pull an incoming message value toward this node's stance.
    ///
    /// drift = bias * sensitivity * |score - incoming|^2, added when the node
    /// sits above the message and subtracted otherwise. Overshoot past the
    /// node's own score is allowed; only the result is clamped to [0,1].
    /// Throws ValidationError for incoming outside [0,1] or sensitivity <= 0.
    double transform(double incoming_ideology, double sensitivity) const;

private:
    uint64_t id_;
    double ideology_score_;
    double bias_multiplier_;
};

/// Validation helpers shared by the node model and the engine.
void validateIdeology(double value, const char* what);
void validateSensitivity(double sensitivity);

} // namespace ideodrift
