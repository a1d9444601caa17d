#include <gtest/gtest.h>
#include "experiment/report_writer.hpp"
#include "experiment/dot_export.hpp"
#include "common/format.hpp"
#include "propagation/propagation_engine.hpp"

#include <sstream>

using namespace ideodrift;

// ─── Number formatting ─────────────────────────────────────────

TEST(FormatTest, Fixed) {
    EXPECT_EQ(formatFixed(0.69, 5), "0.69000");
    EXPECT_EQ(formatFixed(2.346, 2), "2.35");
    EXPECT_EQ(formatFixed(0.0, 5), "0.00000");
}

TEST(FormatTest, Significant) {
    EXPECT_EQ(formatSignificant(0.41780000001, 5), "0.4178");
    EXPECT_EQ(formatSignificant(-0.123456789, 5), "-0.12346");
    EXPECT_EQ(formatSignificant(0.0, 5), "0");
    EXPECT_EQ(formatSignificant(1.5e-7, 5), "1.5e-07");
}

TEST(FormatTest, AsGiven) {
    EXPECT_EQ(formatAsGiven(0.5), "0.5");
    EXPECT_EQ(formatAsGiven(1.0), "1.0");
    EXPECT_EQ(formatAsGiven(2.0), "2.0");
    EXPECT_EQ(formatAsGiven(1.2), "1.2");
    EXPECT_EQ(formatAsGiven(0.1), "0.1");
}

// ─── Report lines ──────────────────────────────────────────────

TEST(ReportWriterTest, HeaderFields) {
    EXPECT_EQ(ReportWriter::header(),
              "Run ID, Node ID, Path Length, Initial Message Ideology, Node Ideology, "
              "Sensitivity, Bias Multiplier, Message Ideology Before, "
              "Message Ideology After, Fidelity Drift, Plausibility Drift, "
              "Transmission Success");
}

TEST(ReportWriterTest, FormatsRecord) {
    PropagationResult r;
    r.node_id = 1;
    r.path_length = 3;
    r.initial_message_ideology = 0.2;
    r.node_ideology = 0.9;
    r.sensitivity = 1.0;
    r.bias_multiplier = 1.0;
    r.ideology_before = 0.2;
    r.ideology_after = 0.69;
    r.fidelity_drift = 0.49;
    r.plausibility_drift = 0.49;

    EXPECT_EQ(ReportWriter::formatRecord(0, r),
              "0, 1, 3, 0.20000, 0.90000, 1.0, 1.00, 0.20000, 0.69000, 0.49000, 0.49, True");
}

TEST(ReportWriterTest, FormatsSaturatedRecord) {
    PropagationResult r;
    r.node_id = 4;
    r.path_length = 10;
    r.initial_message_ideology = 0.123456;
    r.node_ideology = 1.0;
    r.sensitivity = 1.5;
    r.bias_multiplier = 2.456;
    r.ideology_before = 0.7;
    r.ideology_after = 1.0;
    r.fidelity_drift = 0.9;
    r.plausibility_drift = -0.0123456;
    r.state = TransmissionState::Saturated;

    EXPECT_EQ(ReportWriter::formatRecord(12, r),
              "12, 4, 10, 0.12346, 1.00000, 1.5, 2.46, 0.70000, 1.00000, 0.90000, -0.012346, False");
}

TEST(ReportWriterTest, WritesRunRecords) {
    Network net;
    net.addNodeWithIdeology(0, 0.2, 1.0);
    net.addNodeWithIdeology(1, 0.9, 1.0);
    net.addNodeWithIdeology(2, 0.5, 2.0);
    net.addNodeWithIdeology(3, 0.7, 1.0);
    PropagationRun run = PropagationEngine().propagate(net, 0, 3, 1.0);

    std::ostringstream out;
    ReportWriter writer(out);
    writer.writeHeader();
    writer.writeRun(7, run);

    EXPECT_EQ(writer.linesWritten(), 3);
    std::string text = out.str();
    EXPECT_NE(text.find("7, 1, 4, 0.20000, 0.90000, 1.0, 1.00, 0.20000, 0.69000"), std::string::npos);
    EXPECT_NE(text.find("7, 2, 4, 0.20000, 0.50000, 1.0, 2.00, 0.69000, 0.61780, 0.56220, 0.4178, True"),
              std::string::npos);
}

// ─── Graph export ──────────────────────────────────────────────

TEST(DotExportTest, ColourScaleEnds) {
    EXPECT_EQ(ideologyColor(0.0), "#3b4cc0");
    EXPECT_EQ(ideologyColor(1.0), "#b40426");
    EXPECT_EQ(ideologyColor(-3.0), ideologyColor(0.0));
}

TEST(DotExportTest, LabelsTraversedEdges) {
    Network net;
    net.addNodeWithIdeology(0, 0.2, 1.0);
    net.addNodeWithIdeology(1, 0.9, 1.0);
    net.addNodeWithIdeology(2, 0.5, 1.0);
    net.addDetachedNode(3, 0.1, 1.0);
    net.addEdge(2, 3);
    PropagationRun run = PropagationEngine().propagate(net, 0, 2, 1.0);

    std::string dot = toDot(net, &run);
    EXPECT_EQ(dot.rfind("digraph network {", 0), 0u);
    EXPECT_NE(dot.find("0 -> 1 [label=\"0.20\"]"), std::string::npos);
    EXPECT_NE(dot.find("1 -> 2 [label=\"0.69\"]"), std::string::npos);
    EXPECT_NE(dot.find("2 -> 3 [color=gray]"), std::string::npos);
    EXPECT_NE(dot.find("3 [label=\"3\\n0.10\""), std::string::npos);
}

TEST(DotExportTest, WithoutRunNoLabels) {
    Network net;
    net.addNodeWithIdeology(0, 0.2, 1.0);
    net.addNodeWithIdeology(1, 0.9, 1.0);
    std::string dot = toDot(net);
    EXPECT_EQ(dot.find("[label=\"0."), std::string::npos);
    EXPECT_NE(dot.find("0 -> 1 [color=gray]"), std::string::npos);
}
