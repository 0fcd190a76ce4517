// src/plant/energy_balance.cpp
#include "plant/energy_balance.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace plant {

EnergyBalance::EnergyBalance(double capacity_mwh) : capacity_mwh_(capacity_mwh) {}

double EnergyBalance::apply(double energy_mwh, const StepFlows& flows) const {
    const double unclamped = energy_mwh + flows.net_mwh();
    const double clamped = std::clamp(unclamped, 0.0, capacity_mwh_);

    if (clamped != unclamped) {
        LOG_DEBUG("[EnergyBalance] E=%.6f MWh clamped to %.6f MWh (C=%.3f)",
                  unclamped, clamped, capacity_mwh_);
    }
    return clamped;
}

double EnergyBalance::commit(double energy_mwh, const StepFlows& flows,
                             FlowHistory& history, size_t k) const {
    const double next = apply(energy_mwh, flows);
    history.record(k, flows);
    return next;
}

} // namespace plant
