#include "experiment/dot_export.hpp"
#include "common/format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <sstream>
#include <utility>

namespace ideodrift {

std::string ideologyColor(double ideology) {
    double t = std::clamp(ideology, 0.0, 1.0);
    int red = static_cast<int>(std::lround(59 + t * (180 - 59)));
    int green = static_cast<int>(std::lround(76 + t * (4 - 76)));
    int blue = static_cast<int>(std::lround(192 + t * (38 - 192)));

    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", red, green, blue);
    return buf;
}

void writeDot(std::ostream& out, const Network& network, const PropagationRun* run) {
    std::map<std::pair<uint64_t, uint64_t>, double> carried;
    if (run) {
        for (const auto& t : run->traversals) {
            carried[{t.source, t.target}] = t.carried_ideology;
        }
    }

    out << "digraph network {\n";
    out << "  node [shape=circle, style=filled, fontcolor=white];\n";

    network.graph().forEachNode([&](const Node& n) {
        double ideology = network.node(n.id).ideologyScore();
        out << "  " << n.id << " [label=\"" << n.id << "\\n" << formatFixed(ideology, 2)
            << "\", fillcolor=\"" << ideologyColor(ideology) << "\"];\n";
    });

    network.graph().forEachEdge([&](const Edge& e) {
        out << "  " << e.source << " -> " << e.target;
        auto it = carried.find({e.source, e.target});
        if (it != carried.end()) {
            out << " [label=\"" << formatFixed(it->second, 2) << "\"]";
        } else {
            out << " [color=gray]";
        }
        out << ";\n";
    });

    out << "}\n";
}

std::string toDot(const Network& network, const PropagationRun* run) {
    std::ostringstream ss;
    writeDot(ss, network, run);
    return ss.str();
}

} // namespace ideodrift
