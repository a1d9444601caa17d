#pragma once

#include "network/network.hpp"
#include "propagation/propagation_result.hpp"

#include <ostream>
#include <string>

namespace ideodrift {

/// Graphviz rendering of a network. Node fill runs blue (ideology 0) to
/// red (ideology 1); traversed edges are labelled with the carried message
/// value. Rendering only, it never feeds back into a simulation.
void writeDot(std::ostream& out, const Network& network, const PropagationRun* run = nullptr);

std::string toDot(const Network& network, const PropagationRun* run = nullptr);

/// "#rrggbb" on the blue→red scale for an ideology in [0,1].
std::string ideologyColor(double ideology);

} // namespace ideodrift
