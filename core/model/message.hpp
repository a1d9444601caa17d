#pragma once

namespace ideodrift {

/// The value carried along a path. Lives for exactly one propagation run.
struct Message {
    double ideology_score = 0.0;

    Message() = default;
    explicit Message(double ideology_score) : ideology_score(ideology_score) {}

    /// True once the value has hit a hard boundary of the stance axis.
    bool saturated() const {
        return ideology_score == 0.0 || ideology_score == 1.0;
    }
};

} // namespace ideodrift
