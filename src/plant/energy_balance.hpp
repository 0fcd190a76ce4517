// src/plant/energy_balance.hpp
#pragma once

#include "plant/flow_history.hpp"
#include "plant/power_flow_model.hpp"

#include <cstddef>

namespace plant {

/**
 * EnergyBalance - Applies one step of flows to the stored energy
 *
 *   E' = clamp(E + sum(flows), 0, C)
 *
 * Energy beyond the physical bounds is discarded without being tracked.
 * The flows are recorded as computed, independent of clamping.
 */
class EnergyBalance {
public:
    explicit EnergyBalance(double capacity_mwh);

    double apply(double energy_mwh, const StepFlows& flows) const;

    // apply() and record the flows at step k
    double commit(double energy_mwh, const StepFlows& flows,
                  FlowHistory& history, size_t k) const;

private:
    double capacity_mwh_;
};

} // namespace plant
