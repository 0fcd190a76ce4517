// src/sim/sim_results.hpp
#pragma once

#include "plant/flow_history.hpp"
#include "plant/metrics.hpp"
#include "plant/transaction.hpp"

#include <cstddef>
#include <vector>

namespace sim {

struct TransactionRecord {
    plant::TransactionType type = plant::TransactionType::None;
    double scheduled_at_s = 0.0;
    double start_time_s = 0.0;
    double end_time_s = 0.0;
    bool activated = false;
    bool completed = false;
};

/**
 * SimulationResults - Output of one SimulationEngine run
 *
 * All per-step series have the input length n; index 0 holds the initial
 * state (initial SOC, zero E-rate, zero flows). Read-only once returned.
 */
struct SimulationResults {
    std::vector<double> time_s;
    std::vector<double> frequency_hz;
    std::vector<double> soc_pct;
    std::vector<double> e_rate;                       // |P| / C  [1/h]
    std::vector<plant::TransactionState> tx_state;    // state after the step's transition

    plant::FlowHistory flows;
    plant::PerformanceMetrics metrics;
    std::vector<TransactionRecord> transactions;

    void resize(size_t n_steps) {
        time_s.assign(n_steps, 0.0);
        frequency_hz.assign(n_steps, 0.0);
        soc_pct.assign(n_steps, 0.0);
        e_rate.assign(n_steps, 0.0);
        tx_state.assign(n_steps, plant::TransactionState::Idle);
        flows.resize(n_steps);
    }

    size_t size() const { return soc_pct.size(); }

    double final_soc_pct() const { return soc_pct.empty() ? 0.0 : soc_pct.back(); }

    /**
     * Enumerate the fields of step k with their export column names.
     * Shared by the CSV writer and the InfluxDB exporter.
     */
    template<typename Visitor>
    void accept_step(size_t k, Visitor& visitor) const {
        visitor.visit("t_s", time_s.at(k));
        visitor.visit("frequency_hz", frequency_hz.at(k));
        visitor.visit("soc_pct", soc_pct.at(k));
        visitor.visit("e_rate", e_rate.at(k));
        flows.at(k).accept_fields(visitor);
        visitor.visit("tx_state", static_cast<int>(tx_state.at(k)));
    }
};

} // namespace sim
