// src/config/bess_config.hpp
#pragma once

#include <stdexcept>
#include <string>
#include "plant/bess_params.hpp"

namespace config {

// Fatal configuration problem: missing required field, bad type, invalid value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * BessConfig - Loads BESS/PCR parameters from YAML files
 *
 * Usage:
 *   auto cfg = BessConfig::load("config/bess/default.yaml");
 *   sim::SimulationEngine engine(cfg.params);
 *
 * Layout:
 *   bess:
 *     name, description
 *     system:               nominal_frequency_hz, capacity_mwh, prequalified_power_mw,
 *                           efficiency_charge, efficiency_discharge,
 *                           self_consumption_mwh_per_s, [deadband_hz]
 *     soc_management:       initial_soc_pct, schedule_transaction_limits_pct,
 *                           overfulfillment_limits_pct, deadband_limits_pct,
 *                           [use_overfulfillment], [use_deadband_utilization]
 *     schedule_transaction: power_mw, contract_duration_h, lead_time_h
 *
 * Keys in [] are optional; every other key is required.
 */
class BessConfig {
public:
    std::string name;
    std::string description;

    plant::BessParams params;

    /**
     * Load config from YAML file
     * @param yaml_path Path to YAML file
     * @return BessConfig with loaded and validated parameters
     * @throws ConfigError if a required field is missing or any value is invalid
     *
     * If the file doesn't exist, returns the default configuration with a warning.
     */
    static BessConfig load(const std::string& yaml_path);

    /**
     * Parse config from an in-memory YAML document (same rules as load()).
     */
    static BessConfig parse(const std::string& yaml_text);

    /**
     * Reference parameter set (2 MWh / 1 MW, 60 Hz grid).
     */
    static BessConfig get_default();

    /**
     * Validate parameters
     * @throws ConfigError if any parameter is invalid
     */
    void validate() const;

    /**
     * Log summary of configuration
     */
    void print_summary() const;

    BessConfig() = default;
};

} // namespace config
