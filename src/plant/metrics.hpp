// src/plant/metrics.hpp
#pragma once

#include "plant/flow_history.hpp"

namespace plant {

struct ScheduleTxEnergy {
    double charged_mwh = 0.0;
    double discharged_mwh = 0.0;
};

struct EnergyTotals {
    double charged_mwh = 0.0;
    double discharged_mwh = 0.0;
};

struct EnergyShares {
    double pct_charged_via_st = 0.0;
    double pct_discharged_via_st = 0.0;
};

struct PerformanceMetrics {
    double fce = 0.0;                  // full cycle equivalents
    ScheduleTxEnergy schedule_tx_energy;
    EnergyTotals total_energy;         // PC + OF + ST
    EnergyShares energy_shares;
};

/**
 * MetricsCalculator - Post-run aggregation over the flow history
 *
 *   FCE = sum(|PC| + |OF| + |DU| + |ST|) / (2 C)
 *
 * Self-consumption is excluded from throughput. Deadband utilization counts
 * toward FCE but not toward the charged/discharged totals.
 */
class MetricsCalculator {
public:
    explicit MetricsCalculator(double capacity_mwh);

    PerformanceMetrics compute(const FlowHistory& history) const;

private:
    double capacity_mwh_;
};

} // namespace plant
