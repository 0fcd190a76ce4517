// src/sim/sim_app.hpp
#pragma once

#include <optional>
#include <string>

#include "plant/bess_params.hpp"
#include "sim/frequency_source.hpp"
#include "sim/lua_runtime.hpp"
#include "utils/influx.hpp"

namespace sim {

struct SimAppConfig {
    // BESS parameters (empty = built-in defaults)
    std::string bess_config_path;

    // Frequency source, in priority order: CSV, Lua scenario, synthetic
    std::string freq_csv_path;
    std::string lua_script_path;
    SyntheticFrequencyParams synthetic{};

    // Optional copy of the frequency trace actually simulated
    std::string save_freq_path;

    // Flag overrides from the command line
    std::optional<bool> use_overfulfillment;
    std::optional<bool> use_deadband_utilization;

    // Output files
    std::string csv_log_path = "bess_out.csv";
    std::string debug_log_path = "bess_debug.log";
    bool enable_debug_log_file = false;

    // InfluxDB export
    utils::InfluxClient::Config influx{};
};

class SimApp {
public:
    explicit SimApp(SimAppConfig cfg);

    // Returns process exit code
    int run();

private:
    bool acquire_frequency_(const plant::BessParams& params, FrequencySeries& out);

    SimAppConfig cfg_;
    LuaRuntime lua_;
};

} // namespace sim
