#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ideodrift {

/// Parameters of one experiment sweep plus where its output goes.
/// Loadable from YAML:
///
///   sweep:
///     node_counts: [3, 5, 7, 10]
///     sensitivities: [0.5, 1.0, 1.5, 2.0]
///     bias_min: 0.5
///     bias_max: 3.0
///     seed: 42
///   output:
///     report_file: ""
///     dot_file: ""
///     verbose: false
struct ExperimentConfig {
    // === Sweep Settings ===
    struct Sweep {
        std::vector<size_t> node_counts = {3, 5, 7, 10};
        std::vector<double> sensitivities = {0.5, 1.0, 1.5, 2.0};
        double bias_min = 0.5;
        double bias_max = 3.0;
        uint64_t seed = 42;
    } sweep;

    // === Output Settings ===
    struct Output {
        std::string report_file;   // empty = stdout
        std::string dot_file;      // empty = no graph export
        bool verbose = false;
    } output;

    /// Number of runs the sweep will perform.
    size_t runCount() const { return sweep.node_counts.size() * sweep.sensitivities.size(); }

    /// Load configuration from YAML file
    /// @return config if successful, std::nullopt on error (reported to stderr)
    static std::optional<ExperimentConfig> loadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    static std::optional<ExperimentConfig> loadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    bool saveToFile(const std::string& filepath) const;

    std::string toYamlString() const;

    bool validate() const;
    std::vector<std::string> validationErrors() const;

    static ExperimentConfig defaults();
};

} // namespace ideodrift
