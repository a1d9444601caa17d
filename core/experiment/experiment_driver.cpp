#include "experiment/experiment_driver.hpp"
#include "common/errors.hpp"
#include "common/format.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace ideodrift {

size_t SweepResult::failedRuns() const {
    size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) failed++;
    }
    return failed;
}

size_t SweepResult::saturatedRuns() const {
    size_t saturated = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.ok() && outcome.run->saturated()) saturated++;
    }
    return saturated;
}

ExperimentDriver::ExperimentDriver(ExperimentConfig config)
    : config_(std::move(config)) {
    if (!config_.validate()) {
        std::string message = "Invalid experiment configuration:";
        for (const auto& error : config_.validationErrors()) {
            message += "\n  - " + error;
        }
        throw ValidationError(message);
    }
}

std::mt19937 ExperimentDriver::makeRunGenerator(uint64_t seed, size_t run_id) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed & 0xffffffffu),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(run_id & 0xffffffffu),
        static_cast<uint32_t>(static_cast<uint64_t>(run_id) >> 32),
    };
    return std::mt19937(seq);
}

RunOutcome ExperimentDriver::runOnce(size_t run_id, const Network& network,
                                     uint64_t source_id, uint64_t target_id,
                                     double sensitivity) const {
    RunOutcome outcome;
    outcome.run_id = run_id;
    outcome.node_count = network.size();
    outcome.sensitivity = sensitivity;

    try {
        outcome.run = engine_.propagate(network, source_id, target_id, sensitivity);
    } catch (const NoPathError& e) {
        outcome.error = e.what();
        std::cerr << "Run " << run_id << " skipped: " << e.what() << std::endl;
    } catch (const ValidationError& e) {
        outcome.error = e.what();
        std::cerr << "Run " << run_id << " rejected: " << e.what() << std::endl;
    }
    return outcome;
}

SweepResult ExperimentDriver::run(ReportWriter* report) const {
    SweepResult result;
    result.outcomes.reserve(config_.runCount());

    if (report) report->writeHeader();

    size_t run_id = 0;
    for (size_t node_count : config_.sweep.node_counts) {
        for (double sensitivity : config_.sweep.sensitivities) {
            std::mt19937 rng = makeRunGenerator(config_.sweep.seed, run_id);
            Network network = Network::buildChain(node_count, config_.sweep.bias_min,
                                                  config_.sweep.bias_max, rng);

            RunOutcome outcome = runOnce(run_id, network, 0,
                                         static_cast<uint64_t>(node_count - 1),
                                         sensitivity);

            if (outcome.ok()) {
                if (report) report->writeRun(run_id, *outcome.run);
                if (config_.output.verbose) {
                    const PropagationRun& r = *outcome.run;
                    std::cerr << "Run " << run_id << ": nodes=" << node_count
                              << " sensitivity=" << formatAsGiven(sensitivity)
                              << " initial=" << formatFixed(r.initial_message_ideology, 5)
                              << " final=" << formatFixed(r.final_message_ideology, 5)
                              << " state=" << toString(r.state)
                              << " records=" << r.records.size() << std::endl;
                }
            }

            result.outcomes.push_back(std::move(outcome));
            result.last_network = std::move(network);
            run_id++;
        }
    }

    return result;
}

} // namespace ideodrift
