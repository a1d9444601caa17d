#pragma once

#include "experiment/experiment_config.hpp"
#include "experiment/report_writer.hpp"
#include "network/network.hpp"
#include "propagation/propagation_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace ideodrift {

/// Result of one sweep point. Either `run` is set or `error` explains why
/// propagation could not proceed.
struct RunOutcome {
    size_t run_id = 0;
    size_t node_count = 0;
    double sensitivity = 0.0;
    std::optional<PropagationRun> run;
    std::string error;

    bool ok() const { return run.has_value(); }
};

struct SweepResult {
    std::vector<RunOutcome> outcomes;
    std::optional<Network> last_network;   // network of the final run, for export

    size_t failedRuns() const;
    size_t saturatedRuns() const;
};

// ─── Experiment Driver ─────────────────────────────────────────
// Runs node_counts × sensitivities (in that nesting order), one chain
// network per run. Every run draws from its own generator seeded by
// (seed, run_id), so results do not depend on run order.

class ExperimentDriver {
public:
    explicit ExperimentDriver(ExperimentConfig config);

    /// Run the full sweep, streaming records to `report` when given
    /// (header first). Per-run failures are recorded and the sweep continues.
    SweepResult run(ReportWriter* report = nullptr) const;

    /// Propagate over an already built network, capturing NoPathError and
    /// ValidationError into the outcome.
    RunOutcome runOnce(size_t run_id, const Network& network,
                       uint64_t source_id, uint64_t target_id,
                       double sensitivity) const;

    static std::mt19937 makeRunGenerator(uint64_t seed, size_t run_id);

    const ExperimentConfig& config() const { return config_; }

private:
    ExperimentConfig config_;
    PropagationEngine engine_;
};

} // namespace ideodrift
