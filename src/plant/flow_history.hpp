// src/plant/flow_history.hpp
#pragma once

#include "plant/power_flow_model.hpp"

#include <cstddef>
#include <vector>

namespace plant {

/**
 * FlowHistory - Fixed-length per-step record of the five energy flows [MWh]
 *
 * Sized once from the input series length; record() writes by index and
 * never grows the buffers. Index 0 (initial state) stays zero.
 */
struct FlowHistory {
    std::vector<double> primary_control_mwh;
    std::vector<double> overfulfillment_mwh;
    std::vector<double> deadband_util_mwh;
    std::vector<double> schedule_tx_mwh;
    std::vector<double> self_consumption_mwh;

    FlowHistory() = default;
    explicit FlowHistory(size_t n_steps) { resize(n_steps); }

    void resize(size_t n_steps) {
        primary_control_mwh.assign(n_steps, 0.0);
        overfulfillment_mwh.assign(n_steps, 0.0);
        deadband_util_mwh.assign(n_steps, 0.0);
        schedule_tx_mwh.assign(n_steps, 0.0);
        self_consumption_mwh.assign(n_steps, 0.0);
    }

    size_t size() const { return primary_control_mwh.size(); }

    void record(size_t k, const StepFlows& flows) {
        primary_control_mwh.at(k) = flows.primary_control_mwh;
        overfulfillment_mwh.at(k) = flows.overfulfillment_mwh;
        deadband_util_mwh.at(k) = flows.deadband_util_mwh;
        schedule_tx_mwh.at(k) = flows.schedule_tx_mwh;
        self_consumption_mwh.at(k) = flows.self_consumption_mwh;
    }

    StepFlows at(size_t k) const {
        StepFlows f;
        f.primary_control_mwh = primary_control_mwh.at(k);
        f.overfulfillment_mwh = overfulfillment_mwh.at(k);
        f.deadband_util_mwh = deadband_util_mwh.at(k);
        f.schedule_tx_mwh = schedule_tx_mwh.at(k);
        f.self_consumption_mwh = self_consumption_mwh.at(k);
        return f;
    }
};

} // namespace plant
