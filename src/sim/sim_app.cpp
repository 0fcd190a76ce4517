// src/sim/sim_app.cpp
#include "sim/sim_app.hpp"
#include "sim/results_writer.hpp"
#include "sim/sim_errors.hpp"
#include "sim/simulation_engine.hpp"
#include "config/bess_config.hpp"
#include "plant/transaction_scheduler.hpp"
#include "utils/logging.hpp"

#include <utility>

namespace sim {

SimApp::SimApp(SimAppConfig cfg) : cfg_(std::move(cfg)), lua_() {
    if (cfg_.enable_debug_log_file) {
        utils::open_log_file(cfg_.debug_log_path);
    }
}

bool SimApp::acquire_frequency_(const plant::BessParams& params, FrequencySeries& out) {
    if (!cfg_.freq_csv_path.empty()) {
        out = load_frequency_csv(cfg_.freq_csv_path);
        return true;
    }

    if (!cfg_.lua_script_path.empty()) {
        if (!lua_.init(cfg_.lua_script_path, params.nominal_frequency_hz)) {
            LOG_ERROR("Failed to init Lua frequency scenario: %s", cfg_.lua_script_path.c_str());
            return false;
        }
        const std::vector<double> grid =
            make_time_grid(cfg_.synthetic.duration_s, cfg_.synthetic.sample_rate_hz);
        return lua_.generate(grid, out);
    }

    SyntheticFrequencyParams synth = cfg_.synthetic;
    synth.nominal_frequency_hz = params.nominal_frequency_hz;
    out = synthesize_frequency(synth);
    return true;
}

int SimApp::run() {
    try {
        // ====================================================================
        // BESS configuration
        // ====================================================================
        config::BessConfig bess;
        if (!cfg_.bess_config_path.empty()) {
            bess = config::BessConfig::load(cfg_.bess_config_path);
        } else {
            LOG_INFO("No BESS config specified, using defaults");
            bess = config::BessConfig::get_default();
        }

        if (cfg_.use_overfulfillment.has_value()) {
            bess.params.use_overfulfillment = cfg_.use_overfulfillment.value();
        }
        if (cfg_.use_deadband_utilization.has_value()) {
            bess.params.use_deadband_utilization = cfg_.use_deadband_utilization.value();
        }
        bess.print_summary();

        // ====================================================================
        // Frequency trace
        // ====================================================================
        FrequencySeries freq;
        if (!acquire_frequency_(bess.params, freq)) {
            return 1;
        }
        if (!cfg_.save_freq_path.empty() && save_frequency_csv(cfg_.save_freq_path, freq)) {
            LOG_INFO("Frequency trace saved to: %s", cfg_.save_freq_path.c_str());
        }

        // ====================================================================
        // Simulation
        // ====================================================================
        plant::LoggingTransactionObserver tx_log;
        SimulationEngine engine(bess.params, &tx_log);
        const SimulationResults results = engine.run(freq.frequency_hz, freq.time_s);

        // ====================================================================
        // Outputs
        // ====================================================================
        const bool csv_ok = write_results_csv(cfg_.csv_log_path, results);

        if (cfg_.influx.enabled) {
            utils::InfluxClient influx(cfg_.influx);
            influx.export_results(results);
            if (influx.failed_writes() > 0) {
                LOG_WARN("[InfluxDB] %zu batch writes failed", influx.failed_writes());
            }
        }

        log_results_summary(results);
        return csv_ok ? 0 : 1;

    } catch (const config::ConfigError& e) {
        LOG_ERROR("Configuration error: %s", e.what());
        return 1;
    } catch (const InputShapeError& e) {
        LOG_ERROR("Input error: %s", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Simulation failed: %s", e.what());
        return 1;
    }
}

} // namespace sim
