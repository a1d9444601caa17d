#include "experiment/experiment_config.hpp"
#include "common/format.hpp"
#include "common/parse.hpp"

#include <yaml.h>

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ideodrift {

// Helper function to read string from YAML scalar
static std::string getScalarValue(const yaml_event_t& event) {
    return std::string(reinterpret_cast<const char*>(event.data.scalar.value),
                       event.data.scalar.length);
}

static void applyScalar(ExperimentConfig& config, const std::string& section,
                        const std::string& key, const std::string& value) {
    if (section == "sweep") {
        if (key == "bias_min") config.sweep.bias_min = parseDouble(value);
        else if (key == "bias_max") config.sweep.bias_max = parseDouble(value);
        else if (key == "seed") config.sweep.seed = parseUnsigned(value);
        else if (key == "node_counts") config.sweep.node_counts = {static_cast<size_t>(parseUnsigned(value))};
        else if (key == "sensitivities") config.sweep.sensitivities = {parseDouble(value)};
    } else if (section == "output") {
        if (key == "report_file") config.output.report_file = value;
        else if (key == "dot_file") config.output.dot_file = value;
        else if (key == "verbose") config.output.verbose = parseBool(value);
    }
}

static void applySequenceItem(ExperimentConfig& config, const std::string& section,
                              const std::string& key, const std::string& value) {
    if (section != "sweep") return;
    if (key == "node_counts") {
        config.sweep.node_counts.push_back(static_cast<size_t>(parseUnsigned(value)));
    } else if (key == "sensitivities") {
        config.sweep.sensitivities.push_back(parseDouble(value));
    }
}

static void clearSequence(ExperimentConfig& config, const std::string& section,
                          const std::string& key) {
    if (section != "sweep") return;
    if (key == "node_counts") config.sweep.node_counts.clear();
    else if (key == "sensitivities") config.sweep.sensitivities.clear();
}

std::optional<ExperimentConfig> ExperimentConfig::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

std::optional<ExperimentConfig> ExperimentConfig::loadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    ExperimentConfig config = defaults();
    std::string current_section;
    std::string current_key;
    bool in_sequence = false;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " at line "
                          << parser.problem_mark.line + 1;
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        try {
            switch (event.type) {
                case YAML_MAPPING_START_EVENT:
                    depth++;
                    break;

                case YAML_MAPPING_END_EVENT:
                    depth--;
                    if (depth == 1) {
                        current_section.clear();
                    } else if (depth == 2) {
                        // nested mapping under an unknown key
                        current_key.clear();
                    }
                    break;

                case YAML_SEQUENCE_START_EVENT:
                    if (depth == 2 && !current_key.empty()) {
                        in_sequence = true;
                        clearSequence(config, current_section, current_key);
                    }
                    break;

                case YAML_SEQUENCE_END_EVENT:
                    if (in_sequence) {
                        in_sequence = false;
                        current_key.clear();
                    }
                    break;

                case YAML_SCALAR_EVENT: {
                    std::string value = getScalarValue(event);

                    if (depth == 1) {
                        current_section = value;
                    } else if (depth == 2) {
                        if (in_sequence) {
                            applySequenceItem(config, current_section, current_key, value);
                        } else if (current_key.empty()) {
                            current_key = value;
                        } else {
                            applyScalar(config, current_section, current_key, value);
                            current_key.clear();
                        }
                    }
                    break;
                }

                case YAML_STREAM_END_EVENT:
                case YAML_DOCUMENT_END_EVENT:
                    done = true;
                    break;

                default:
                    break;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << current_section << "." << current_key
                      << ": " << e.what() << std::endl;
            yaml_event_delete(&event);
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.validationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool ExperimentConfig::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << toYamlString();
    return static_cast<bool>(file);
}

std::string ExperimentConfig::toYamlString() const {
    std::ostringstream ss;

    ss << "# IdeoDrift experiment configuration\n\n";

    ss << "sweep:\n";
    ss << "  node_counts: [";
    for (size_t i = 0; i < sweep.node_counts.size(); i++) {
        if (i > 0) ss << ", ";
        ss << sweep.node_counts[i];
    }
    ss << "]\n";
    ss << "  sensitivities: [";
    for (size_t i = 0; i < sweep.sensitivities.size(); i++) {
        if (i > 0) ss << ", ";
        ss << formatAsGiven(sweep.sensitivities[i]);
    }
    ss << "]\n";
    ss << "  bias_min: " << formatAsGiven(sweep.bias_min) << "\n";
    ss << "  bias_max: " << formatAsGiven(sweep.bias_max) << "\n";
    ss << "  seed: " << sweep.seed << "\n\n";

    ss << "output:\n";
    ss << "  report_file: \"" << output.report_file << "\"\n";
    ss << "  dot_file: \"" << output.dot_file << "\"\n";
    ss << "  verbose: " << (output.verbose ? "true" : "false") << "\n";

    return ss.str();
}

bool ExperimentConfig::validate() const {
    return validationErrors().empty();
}

std::vector<std::string> ExperimentConfig::validationErrors() const {
    std::vector<std::string> errors;

    if (sweep.node_counts.empty()) {
        errors.push_back("sweep.node_counts must not be empty");
    }
    for (size_t count : sweep.node_counts) {
        if (count < 2) {
            errors.push_back("sweep.node_counts entries must be >= 2, got " +
                             std::to_string(count));
        }
    }

    if (sweep.sensitivities.empty()) {
        errors.push_back("sweep.sensitivities must not be empty");
    }
    for (double s : sweep.sensitivities) {
        if (!std::isfinite(s) || s <= 0.0) {
            errors.push_back("sweep.sensitivities entries must be > 0, got " + formatAsGiven(s));
        }
    }

    if (!std::isfinite(sweep.bias_min) || sweep.bias_min <= 0.0) {
        errors.push_back("sweep.bias_min must be > 0");
    }
    if (!std::isfinite(sweep.bias_max) || sweep.bias_max < sweep.bias_min) {
        errors.push_back("sweep.bias_max must be >= sweep.bias_min");
    }

    return errors;
}

ExperimentConfig ExperimentConfig::defaults() {
    return ExperimentConfig{};
}

} // namespace ideodrift
