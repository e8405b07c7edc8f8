// File: src/cli/cli_config.cpp
//
// YAML Configuration Implementation for the StockLens CLI

#include "cli/cli_config.hpp"
#include "core/logging.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace stocklens {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Apply one "section.key: value" setting
// @throws std::invalid_argument / std::out_of_range on malformed numbers
static void ApplySetting(CliConfig& config,
                         const std::string& section,
                         const std::string& key,
                         const std::string& value) {
    if (section == "storage") {
        if (key == "backend") config.storage.backend = value;
        else if (key == "db_path") config.storage.db_path = value;
        else if (key == "enable_wal") config.storage.enable_wal = ParseBool(value);
        else if (key == "synchronous") config.storage.synchronous = value;
    }
    else if (section == "analytics") {
        if (key == "statistics_window_days") config.analytics.statistics_window_days = std::stoi(value);
        else if (key == "update_window_days") config.analytics.update_window_days = std::stoi(value);
        else if (key == "correlation_window_days") config.analytics.correlation_window_days = std::stoi(value);
        else if (key == "min_data_points") config.analytics.min_data_points = std::stoi(value);
        else if (key == "significance_threshold") config.analytics.significance_threshold = Decimal::Parse(value);
        else if (key == "recommendation_limit") config.analytics.recommendation_limit = std::stoul(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
    }
}

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CliConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error: "
                      << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": '" << value << "' ("
                                      << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
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

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# StockLens Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n";
    ss << "  enable_wal: " << (storage.enable_wal ? "true" : "false") << "\n";
    ss << "  synchronous: \"" << storage.synchronous << "\"\n\n";

    ss << "analytics:\n";
    ss << "  statistics_window_days: " << analytics.statistics_window_days << "\n";
    ss << "  update_window_days: " << analytics.update_window_days << "\n";
    ss << "  correlation_window_days: " << analytics.correlation_window_days << "\n";
    ss << "  min_data_points: " << analytics.min_data_points << "\n";
    ss << "  significance_threshold: " << analytics.significance_threshold.ToString() << "\n";
    ss << "  recommendation_limit: " << analytics.recommendation_limit << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate storage
    if (storage.backend != "memory" && storage.backend != "sqlite") {
        errors.push_back("backend must be one of: memory, sqlite");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("db_path is required for the sqlite backend");
    }
    if (storage.synchronous != "FULL" &&
        storage.synchronous != "NORMAL" &&
        storage.synchronous != "OFF") {
        errors.push_back("synchronous must be one of: FULL, NORMAL, OFF");
    }

    // Validate windows
    if (analytics.statistics_window_days <= 0) {
        errors.push_back("statistics_window_days must be greater than 0");
    }
    if (analytics.update_window_days <= 0) {
        errors.push_back("update_window_days must be greater than 0");
    }
    if (analytics.correlation_window_days <= 0) {
        errors.push_back("correlation_window_days must be greater than 0");
    }

    // Validate correlation settings
    if (analytics.min_data_points < 2) {
        errors.push_back("min_data_points must be at least 2");
    }
    if (analytics.significance_threshold.Sign() < 0 || analytics.significance_threshold > Decimal(1)) {
        errors.push_back("significance_threshold must be between 0.0 and 1.0");
    }
    if (analytics.recommendation_limit == 0) {
        errors.push_back("recommendation_limit must be greater than 0");
    }

    // Validate logging
    try {
        ParseLogLevel(logging.level);
    } catch (const std::invalid_argument&) {
        errors.push_back("level must be one of: DEBUG, INFO, WARN, ERROR, OFF");
    }

    return errors;
}

AnalyticsEngine::Config CliConfig::ToEngineConfig() const {
    AnalyticsEngine::Config engine_config;
    engine_config.statistics_window_days = analytics.statistics_window_days;
    engine_config.update_window_days = analytics.update_window_days;
    engine_config.correlation_window_days = analytics.correlation_window_days;
    engine_config.min_data_points = analytics.min_data_points;
    engine_config.significance_threshold = analytics.significance_threshold;
    engine_config.recommendation_limit = analytics.recommendation_limit;
    return engine_config;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace stocklens
