// src/config/bess_config.cpp
#include "config/bess_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace config {

namespace {

YAML::Node require_section(const YAML::Node& parent, const char* key) {
    YAML::Node n = parent[key];
    if (!n || !n.IsMap()) {
        throw ConfigError(std::string("Missing required section: bess.") + key);
    }
    return n;
}

double require_double(const YAML::Node& section, const char* section_name, const char* key) {
    const YAML::Node n = section[key];
    if (!n) {
        throw ConfigError(std::string("Missing required parameter: bess.") +
                          section_name + "." + key);
    }
    return n.as<double>();
}

plant::SocLimits require_limits(const YAML::Node& section, const char* section_name, const char* key) {
    const YAML::Node n = section[key];
    if (!n) {
        throw ConfigError(std::string("Missing required parameter: bess.") +
                          section_name + "." + key);
    }
    if (!n.IsSequence() || n.size() != 2) {
        throw ConfigError(std::string("Parameter bess.") + section_name + "." + key +
                          " must be a [low, high] pair");
    }
    plant::SocLimits lim;
    lim.low_pct = n[0].as<double>();
    lim.high_pct = n[1].as<double>();
    return lim;
}

void check_limits(const plant::SocLimits& lim, const char* what) {
    if (!(lim.low_pct >= 0.0 && lim.high_pct <= 100.0 && lim.low_pct <= lim.high_pct)) {
        throw ConfigError(std::string("Invalid ") + what +
                          " SOC limits: need 0 <= low <= high <= 100");
    }
}

BessConfig from_node(const YAML::Node& root) {
    const YAML::Node bess = root["bess"];
    if (!bess || !bess.IsMap()) {
        throw ConfigError("Missing top-level 'bess' section");
    }

    BessConfig cfg;
    cfg.name = bess["name"].as<std::string>("Unnamed BESS");
    cfg.description = bess["description"].as<std::string>("");

    // ====================================================================
    // Parse system
    // ====================================================================
    const YAML::Node sys = require_section(bess, "system");
    cfg.params.nominal_frequency_hz = require_double(sys, "system", "nominal_frequency_hz");
    cfg.params.capacity_mwh = require_double(sys, "system", "capacity_mwh");
    cfg.params.prequalified_power_mw = require_double(sys, "system", "prequalified_power_mw");
    cfg.params.efficiency_charge = require_double(sys, "system", "efficiency_charge");
    cfg.params.efficiency_discharge = require_double(sys, "system", "efficiency_discharge");
    cfg.params.self_consumption_mwh_per_s = require_double(sys, "system", "self_consumption_mwh_per_s");
    cfg.params.deadband_hz = sys["deadband_hz"].as<double>(0.01);

    // ====================================================================
    // Parse SOC management
    // ====================================================================
    const YAML::Node soc = require_section(bess, "soc_management");
    cfg.params.initial_soc_pct = require_double(soc, "soc_management", "initial_soc_pct");
    cfg.params.schedule_tx_limits = require_limits(soc, "soc_management", "schedule_transaction_limits_pct");
    cfg.params.overfulfillment_limits = require_limits(soc, "soc_management", "overfulfillment_limits_pct");
    cfg.params.deadband_limits = require_limits(soc, "soc_management", "deadband_limits_pct");
    cfg.params.use_overfulfillment = soc["use_overfulfillment"].as<bool>(false);
    cfg.params.use_deadband_utilization = soc["use_deadband_utilization"].as<bool>(false);

    // ====================================================================
    // Parse schedule transaction
    // ====================================================================
    const YAML::Node st = require_section(bess, "schedule_transaction");
    cfg.params.schedule_tx_power_mw = require_double(st, "schedule_transaction", "power_mw");
    cfg.params.contract_duration_h = require_double(st, "schedule_transaction", "contract_duration_h");
    cfg.params.lead_time_h = require_double(st, "schedule_transaction", "lead_time_h");

    cfg.validate();
    return cfg;
}

} // namespace

BessConfig BessConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[BessConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[BessConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[BessConfig] Loading BESS config from: %s", yaml_path.c_str());

    try {
        BessConfig cfg = from_node(YAML::LoadFile(yaml_path));
        LOG_INFO("[BessConfig] Successfully loaded: %s", cfg.name.c_str());
        return cfg;
    } catch (const ConfigError&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("[BessConfig] YAML parse error: ") + e.what());
    }
}

BessConfig BessConfig::parse(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const ConfigError&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("[BessConfig] YAML parse error: ") + e.what());
    }
}

BessConfig BessConfig::get_default() {
    BessConfig cfg;

    cfg.name = "Reference BESS 2 MWh / 1 MW (Default)";
    cfg.description = "PCR reference parameter set";

    // System
    cfg.params.nominal_frequency_hz = 60.0;
    cfg.params.deadband_hz = 0.01;
    cfg.params.capacity_mwh = 2.0;
    cfg.params.prequalified_power_mw = 1.0;
    cfg.params.efficiency_charge = 0.9;
    cfg.params.efficiency_discharge = 0.9;
    cfg.params.self_consumption_mwh_per_s = 3.85e-8;

    // SOC management
    cfg.params.initial_soc_pct = 40.0;
    cfg.params.schedule_tx_limits = {39.0, 41.0};
    cfg.params.overfulfillment_limits = {50.0, 50.0};
    cfg.params.deadband_limits = {50.0, 50.0};
    cfg.params.use_overfulfillment = false;
    cfg.params.use_deadband_utilization = false;

    // Schedule transaction
    cfg.params.schedule_tx_power_mw = 0.5;
    cfg.params.contract_duration_h = 0.5;
    cfg.params.lead_time_h = 0.75;

    return cfg;
}

void BessConfig::validate() const {
    // Comparisons are negated so NaN values fail

    // System validation
    if (!(params.nominal_frequency_hz > 0.0)) {
        throw ConfigError("Invalid nominal_frequency_hz: must be > 0");
    }
    if (!(params.deadband_hz >= 0.0)) {
        throw ConfigError("Invalid deadband_hz: must be >= 0");
    }
    if (!(params.capacity_mwh > 0.0)) {
        throw ConfigError("Invalid capacity_mwh: must be > 0");
    }
    if (!(params.prequalified_power_mw >= 0.0)) {
        throw ConfigError("Invalid prequalified_power_mw: must be >= 0");
    }
    if (!(params.efficiency_charge > 0.0 && params.efficiency_charge <= 1.0)) {
        throw ConfigError("Invalid efficiency_charge: must be 0 < eff <= 1");
    }
    if (!(params.efficiency_discharge > 0.0 && params.efficiency_discharge <= 1.0)) {
        throw ConfigError("Invalid efficiency_discharge: must be 0 < eff <= 1");
    }
    if (!(params.self_consumption_mwh_per_s >= 0.0)) {
        throw ConfigError("Invalid self_consumption_mwh_per_s: must be >= 0");
    }

    // SOC management validation
    if (!(params.initial_soc_pct >= 0.0 && params.initial_soc_pct <= 100.0)) {
        throw ConfigError("Invalid initial_soc_pct: must be within [0, 100]");
    }
    check_limits(params.schedule_tx_limits, "schedule transaction");
    check_limits(params.overfulfillment_limits, "overfulfillment");
    check_limits(params.deadband_limits, "deadband utilization");

    // Schedule transaction validation
    if (!(params.schedule_tx_power_mw >= 0.0)) {
        throw ConfigError("Invalid schedule transaction power_mw: must be >= 0");
    }
    if (!(params.contract_duration_h >= 0.0)) {
        throw ConfigError("Invalid contract_duration_h: must be >= 0");
    }
    if (!(params.lead_time_h >= 0.0)) {
        throw ConfigError("Invalid lead_time_h: must be >= 0");
    }

    LOG_DEBUG("[BessConfig] Validation passed");
}

void BessConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("BESS Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Capacity: %.2f MWh, P_PQ: %.2f MW", params.capacity_mwh, params.prequalified_power_mw);
    LOG_INFO("Efficiency: charge %.3f, discharge %.3f",
             params.efficiency_charge, params.efficiency_discharge);
    LOG_INFO("Nominal frequency: %.2f Hz (deadband +/-%.3f Hz)",
             params.nominal_frequency_hz, params.deadband_hz);
    LOG_INFO("Self-consumption: %.3e MWh/s", params.self_consumption_mwh_per_s);
    LOG_INFO("Initial SOC: %.1f%%", params.initial_soc_pct);
    LOG_INFO("ST limits: [%.1f, %.1f]%%, P_ST=%.2f MW, contract %.2f h, lead %.2f h",
             params.schedule_tx_limits.low_pct, params.schedule_tx_limits.high_pct,
             params.schedule_tx_power_mw, params.contract_duration_h, params.lead_time_h);
    LOG_INFO("Overfulfillment: %s [%.1f, %.1f]%%",
             params.use_overfulfillment ? "on" : "off",
             params.overfulfillment_limits.low_pct, params.overfulfillment_limits.high_pct);
    LOG_INFO("Deadband utilization: %s [%.1f, %.1f]%%",
             params.use_deadband_utilization ? "on" : "off",
             params.deadband_limits.low_pct, params.deadband_limits.high_pct);
    LOG_INFO("========================================");
}

} // namespace config
