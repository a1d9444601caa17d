// IdeoDrift command-line driver.
// Runs a propagation sweep and writes the per-hop report.

#include "common/parse.hpp"
#include "experiment/dot_export.hpp"
#include "experiment/experiment_config.hpp"
#include "experiment/experiment_driver.hpp"
#include "experiment/report_writer.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace ideodrift;

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  --config FILE                YAML experiment configuration\n"
              << "  --seed N                     override sweep.seed\n"
              << "  --output FILE                write report to FILE instead of stdout\n"
              << "  --dot FILE                   export the last run's network as Graphviz\n"
              << "  --verbose                    per-run summary on stderr\n"
              << "  --write-default-config FILE  save the default configuration and exit\n"
              << "  --help                       show this message\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string default_config_path;
    std::optional<uint64_t> seed_override;
    std::string output_override;
    std::string dot_override;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            const char* text = argv[++i];
            try {
                seed_override = parseUnsigned(text);
            } catch (const std::invalid_argument&) {
                std::cerr << "Invalid --seed value: " << text << "\n";
                printUsage(argv[0]);
                return 2;
            } catch (const std::out_of_range&) {
                std::cerr << "--seed value out of range: " << text << "\n";
                printUsage(argv[0]);
                return 2;
            }
        } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output_override = argv[++i];
        } else if (strcmp(argv[i], "--dot") == 0 && i + 1 < argc) {
            dot_override = argv[++i];
        } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--write-default-config") == 0 && i + 1 < argc) {
            default_config_path = argv[++i];
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!default_config_path.empty()) {
        return ExperimentConfig::defaults().saveToFile(default_config_path) ? 0 : 1;
    }

    try {
        ExperimentConfig config = ExperimentConfig::defaults();
        if (!config_path.empty()) {
            auto loaded = ExperimentConfig::loadFromFile(config_path);
            if (!loaded) return 1;
            config = *loaded;
        }
        if (seed_override) config.sweep.seed = *seed_override;
        if (!output_override.empty()) config.output.report_file = output_override;
        if (!dot_override.empty()) config.output.dot_file = dot_override;
        if (verbose) config.output.verbose = true;

        std::ofstream report_file;
        std::ostream* report_stream = &std::cout;
        if (!config.output.report_file.empty()) {
            report_file.open(config.output.report_file);
            if (!report_file.is_open()) {
                std::cerr << "Failed to open report file: " << config.output.report_file << "\n";
                return 1;
            }
            report_stream = &report_file;
        }

        ExperimentDriver driver(config);
        ReportWriter writer(*report_stream);
        SweepResult result = driver.run(&writer);

        if (!config.output.dot_file.empty() && result.last_network) {
            std::ofstream dot(config.output.dot_file);
            if (!dot.is_open()) {
                std::cerr << "Failed to open DOT file: " << config.output.dot_file << "\n";
                return 1;
            }
            const RunOutcome& last = result.outcomes.back();
            writeDot(dot, *result.last_network, last.ok() ? &*last.run : nullptr);
        }

        if (config.output.verbose) {
            std::cerr << result.outcomes.size() << " runs, "
                      << result.saturatedRuns() << " saturated, "
                      << result.failedRuns() << " failed\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
