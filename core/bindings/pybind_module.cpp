// PyBind11 bindings for the IdeoDrift C++ core.
// Exposes Graph, IdeologyNode, Network, PropagationEngine and the
// experiment driver to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DIDEODRIFT_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "graph/graph.hpp"
#include "model/ideology_node.hpp"
#include "network/network.hpp"
#include "propagation/propagation_engine.hpp"
#include "experiment/experiment_config.hpp"
#include "experiment/experiment_driver.hpp"
#include "experiment/report_writer.hpp"
#include "experiment/dot_export.hpp"

#include <random>

namespace py = pybind11;

PYBIND11_MODULE(ideodrift_bindings, m) {
    m.doc() = "IdeoDrift C++ Core Bindings";

    // ── Errors ──
    auto base_error = py::register_exception<ideodrift::IdeoDriftError>(m, "IdeoDriftError");
    py::register_exception<ideodrift::ValidationError>(m, "ValidationError", base_error.ptr());
    py::register_exception<ideodrift::NoPathError>(m, "NoPathError", base_error.ptr());

    // ── Graph ──
    py::class_<ideodrift::Node>(m, "Node")
        .def_readonly("id", &ideodrift::Node::id)
        .def("get_attribute", &ideodrift::Node::getAttribute,
             py::arg("key"), py::arg("default_val") = "")
        .def("has_attribute", &ideodrift::Node::hasAttribute);

    py::class_<ideodrift::Graph>(m, "Graph")
        .def(py::init<>())
        .def("add_node", &ideodrift::Graph::addNode)
        .def("add_node_with_id", &ideodrift::Graph::addNodeWithId,
             py::arg("id"), py::arg("attributes") = std::unordered_map<std::string, std::string>{})
        .def("add_edge", &ideodrift::Graph::addEdge)
        .def("has_node", &ideodrift::Graph::hasNode)
        .def("node_count", &ideodrift::Graph::nodeCount)
        .def("edge_count", &ideodrift::Graph::edgeCount)
        .def("get_node_ids", &ideodrift::Graph::getNodeIds)
        .def("get_successors", &ideodrift::Graph::getSuccessors)
        .def("shortest_path", &ideodrift::Graph::shortestPath);

    // ── Node model ──
    py::class_<ideodrift::IdeologyNode>(m, "IdeologyNode")
        .def(py::init<uint64_t, double, double>(),
             py::arg("id"), py::arg("ideology_score"), py::arg("bias_multiplier"))
        .def_property_readonly("id", &ideodrift::IdeologyNode::id)
        .def_property_readonly("ideology_score", &ideodrift::IdeologyNode::ideologyScore)
        .def_property_readonly("bias_multiplier", &ideodrift::IdeologyNode::biasMultiplier)
        .def("transform", &ideodrift::IdeologyNode::transform,
             py::arg("incoming_ideology"), py::arg("sensitivity"));

    // ── Network ──
    py::class_<ideodrift::Network>(m, "Network")
        .def(py::init<>())
        .def("add_node", [](ideodrift::Network& self, uint64_t id, double ideology, double bias) {
            return self.addNodeWithIdeology(id, ideology, bias);
        }, py::arg("id"), py::arg("ideology_score"), py::arg("bias_multiplier") = 1.0)
        .def("add_detached_node", &ideodrift::Network::addDetachedNode)
        .def("add_edge", &ideodrift::Network::addEdge)
        .def("add_edge_from_last_node", &ideodrift::Network::addEdgeFromLastNode)
        .def("node", &ideodrift::Network::node, py::return_value_policy::reference_internal)
        .def("graph", &ideodrift::Network::graph, py::return_value_policy::reference_internal)
        .def("size", &ideodrift::Network::size)
        .def_static("build_chain", [](size_t node_count, double bias_min, double bias_max,
                                      uint64_t seed) {
            std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
            return ideodrift::Network::buildChain(node_count, bias_min, bias_max, rng);
        }, py::arg("node_count"), py::arg("bias_min"), py::arg("bias_max"), py::arg("seed"));

    // ── Propagation ──
    py::enum_<ideodrift::TransmissionState>(m, "TransmissionState")
        .value("CONTINUING", ideodrift::TransmissionState::Continuing)
        .value("SATURATED", ideodrift::TransmissionState::Saturated);

    py::class_<ideodrift::PropagationResult>(m, "PropagationResult")
        .def(py::init<>())
        .def_readonly("hop_index", &ideodrift::PropagationResult::hop_index)
        .def_readonly("node_id", &ideodrift::PropagationResult::node_id)
        .def_readonly("path_length", &ideodrift::PropagationResult::path_length)
        .def_readonly("initial_message_ideology", &ideodrift::PropagationResult::initial_message_ideology)
        .def_readonly("node_ideology", &ideodrift::PropagationResult::node_ideology)
        .def_readonly("sensitivity", &ideodrift::PropagationResult::sensitivity)
        .def_readonly("bias_multiplier", &ideodrift::PropagationResult::bias_multiplier)
        .def_readonly("ideology_before", &ideodrift::PropagationResult::ideology_before)
        .def_readonly("ideology_after", &ideodrift::PropagationResult::ideology_after)
        .def_readonly("fidelity_drift", &ideodrift::PropagationResult::fidelity_drift)
        .def_readonly("plausibility_drift", &ideodrift::PropagationResult::plausibility_drift)
        .def_readonly("state", &ideodrift::PropagationResult::state)
        .def("transmission_success", &ideodrift::PropagationResult::transmissionSuccess);

    py::class_<ideodrift::EdgeTraversal>(m, "EdgeTraversal")
        .def_readonly("source", &ideodrift::EdgeTraversal::source)
        .def_readonly("target", &ideodrift::EdgeTraversal::target)
        .def_readonly("carried_ideology", &ideodrift::EdgeTraversal::carried_ideology);

    py::class_<ideodrift::PropagationRun>(m, "PropagationRun")
        .def_readonly("path", &ideodrift::PropagationRun::path)
        .def_readonly("sensitivity", &ideodrift::PropagationRun::sensitivity)
        .def_readonly("initial_message_ideology", &ideodrift::PropagationRun::initial_message_ideology)
        .def_readonly("final_message_ideology", &ideodrift::PropagationRun::final_message_ideology)
        .def_readonly("state", &ideodrift::PropagationRun::state)
        .def_readonly("records", &ideodrift::PropagationRun::records)
        .def_readonly("traversals", &ideodrift::PropagationRun::traversals)
        .def("saturated", &ideodrift::PropagationRun::saturated)
        .def("reached_target", &ideodrift::PropagationRun::reachedTarget);

    py::class_<ideodrift::PropagationEngine>(m, "PropagationEngine")
        .def(py::init<>())
        .def("propagate", &ideodrift::PropagationEngine::propagate,
             py::arg("network"), py::arg("source_id"), py::arg("target_id"),
             py::arg("sensitivity"));

    // ── Experiment ──
    py::class_<ideodrift::ExperimentConfig::Sweep>(m, "SweepConfig")
        .def(py::init<>())
        .def_readwrite("node_counts", &ideodrift::ExperimentConfig::Sweep::node_counts)
        .def_readwrite("sensitivities", &ideodrift::ExperimentConfig::Sweep::sensitivities)
        .def_readwrite("bias_min", &ideodrift::ExperimentConfig::Sweep::bias_min)
        .def_readwrite("bias_max", &ideodrift::ExperimentConfig::Sweep::bias_max)
        .def_readwrite("seed", &ideodrift::ExperimentConfig::Sweep::seed);

    py::class_<ideodrift::ExperimentConfig>(m, "ExperimentConfig")
        .def(py::init<>())
        .def_readwrite("sweep", &ideodrift::ExperimentConfig::sweep)
        .def("validate", &ideodrift::ExperimentConfig::validate)
        .def("validation_errors", &ideodrift::ExperimentConfig::validationErrors)
        .def("to_yaml", &ideodrift::ExperimentConfig::toYamlString)
        .def_static("load_from_string", &ideodrift::ExperimentConfig::loadFromString);

    py::class_<ideodrift::RunOutcome>(m, "RunOutcome")
        .def_readonly("run_id", &ideodrift::RunOutcome::run_id)
        .def_readonly("node_count", &ideodrift::RunOutcome::node_count)
        .def_readonly("sensitivity", &ideodrift::RunOutcome::sensitivity)
        .def_readonly("run", &ideodrift::RunOutcome::run)
        .def_readonly("error", &ideodrift::RunOutcome::error)
        .def("ok", &ideodrift::RunOutcome::ok);

    m.def("run_sweep", [](const ideodrift::ExperimentConfig& config) {
        ideodrift::ExperimentDriver driver(config);
        return driver.run().outcomes;
    }, py::arg("config"));

    m.def("format_record", &ideodrift::ReportWriter::formatRecord,
          py::arg("run_id"), py::arg("record"));
    m.def("report_header", &ideodrift::ReportWriter::header);

    m.def("to_dot", [](const ideodrift::Network& network, const ideodrift::PropagationRun* run) {
        return ideodrift::toDot(network, run);
    }, py::arg("network"), py::arg("run") = nullptr);
}
