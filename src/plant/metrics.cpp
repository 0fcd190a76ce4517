// src/plant/metrics.cpp
#include "plant/metrics.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <vector>

namespace plant {

namespace {

double sum_abs(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += std::abs(x);
    return s;
}

double sum_positive(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) {
        if (x > 0.0) s += x;
    }
    return s;
}

double sum_negative(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) {
        if (x < 0.0) s += x;
    }
    return s;
}

double share_pct(double part, double total) {
    return total > 0.0 ? part / total * 100.0 : 0.0;
}

} // namespace

MetricsCalculator::MetricsCalculator(double capacity_mwh) : capacity_mwh_(capacity_mwh) {}

PerformanceMetrics MetricsCalculator::compute(const FlowHistory& h) const {
    PerformanceMetrics m;

    const double throughput_mwh = sum_abs(h.primary_control_mwh) +
                                  sum_abs(h.overfulfillment_mwh) +
                                  sum_abs(h.deadband_util_mwh) +
                                  sum_abs(h.schedule_tx_mwh);
    m.fce = throughput_mwh / (2.0 * capacity_mwh_);

    m.schedule_tx_energy.charged_mwh = sum_positive(h.schedule_tx_mwh);
    m.schedule_tx_energy.discharged_mwh = -sum_negative(h.schedule_tx_mwh);

    m.total_energy.charged_mwh = sum_positive(h.primary_control_mwh) +
                                 sum_positive(h.overfulfillment_mwh) +
                                 m.schedule_tx_energy.charged_mwh;
    m.total_energy.discharged_mwh = -sum_negative(h.primary_control_mwh) -
                                    sum_negative(h.overfulfillment_mwh) +
                                    m.schedule_tx_energy.discharged_mwh;

    m.energy_shares.pct_charged_via_st =
        share_pct(m.schedule_tx_energy.charged_mwh, m.total_energy.charged_mwh);
    m.energy_shares.pct_discharged_via_st =
        share_pct(m.schedule_tx_energy.discharged_mwh, m.total_energy.discharged_mwh);

    LOG_DEBUG("[MetricsCalculator] throughput=%.4f MWh FCE=%.4f over %zu steps",
              throughput_mwh, m.fce, h.size());
    return m;
}

} // namespace plant
