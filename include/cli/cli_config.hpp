// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the StockLens CLI
// Allows loading storage, analytics and logging settings from YAML files

#ifndef STOCKLENS_CLI_CONFIG_HPP
#define STOCKLENS_CLI_CONFIG_HPP

#include "core/decimal.hpp"
#include "engine/analytics_engine.hpp"
#include <string>
#include <optional>
#include <vector>

namespace stocklens {

/// Configuration structure for the StockLens CLI
struct CliConfig {
    // === Storage Settings ===
    struct Storage {
        std::string backend = "memory";           // "memory" or "sqlite"
        std::string db_path = "stocklens.db";
        bool enable_wal = true;
        std::string synchronous = "NORMAL";       // FULL, NORMAL or OFF
    } storage;

    // === Analytics Settings ===
    struct Analytics {
        int statistics_window_days = 30;
        int update_window_days = 30;
        int correlation_window_days = 90;
        int min_data_points = 5;
        Decimal significance_threshold = Decimal::Parse("0.3");
        size_t recommendation_limit = 5;
    } analytics;

    // === Logging Settings ===
    struct Logging {
        std::string level = "INFO";               // DEBUG, INFO, WARN, ERROR, OFF
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Analytics section as engine settings
    AnalyticsEngine::Config ToEngineConfig() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace stocklens

#endif // STOCKLENS_CLI_CONFIG_HPP
