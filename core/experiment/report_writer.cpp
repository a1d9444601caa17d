#include "experiment/report_writer.hpp"
#include "common/format.hpp"

#include <sstream>

namespace ideodrift {

std::string ReportWriter::header() {
    return "Run ID, Node ID, Path Length, Initial Message Ideology, Node Ideology, "
           "Sensitivity, Bias Multiplier, Message Ideology Before, "
           "Message Ideology After, Fidelity Drift, Plausibility Drift, "
           "Transmission Success";
}

std::string ReportWriter::formatRecord(size_t run_id, const PropagationResult& record) {
    std::ostringstream ss;
    ss << run_id << ", "
       << record.node_id << ", "
       << record.path_length << ", "
       << formatFixed(record.initial_message_ideology, 5) << ", "
       << formatFixed(record.node_ideology, 5) << ", "
       << formatAsGiven(record.sensitivity) << ", "
       << formatFixed(record.bias_multiplier, 2) << ", "
       << formatFixed(record.ideology_before, 5) << ", "
       << formatFixed(record.ideology_after, 5) << ", "
       << formatFixed(record.fidelity_drift, 5) << ", "
       << formatSignificant(record.plausibility_drift, 5) << ", "
       << (record.transmissionSuccess() ? "True" : "False");
    return ss.str();
}

void ReportWriter::writeHeader() {
    out_ << header() << '\n';
    lines_written_++;
}

void ReportWriter::writeRecord(size_t run_id, const PropagationResult& record) {
    out_ << formatRecord(run_id, record) << '\n';
    lines_written_++;
}

void ReportWriter::writeRun(size_t run_id, const PropagationRun& run) {
    for (const auto& record : run.records) {
        writeRecord(run_id, record);
    }
}

} // namespace ideodrift
