// src/plant/bess_params.hpp
#pragma once

namespace plant {

// SOC threshold pair in percent, low <= high.
struct SocLimits {
    double low_pct = 50.0;
    double high_pct = 50.0;
};

// Physical and operational parameters of one BESS providing PCR.
// Units are embedded in field names.
struct BessParams {
    // --- Grid
    double nominal_frequency_hz = 60.0;   // fn
    double deadband_hz = 0.01;            // half-width of the PCR deadband around fn

    // --- Storage
    double capacity_mwh = 2.0;            // C
    double prequalified_power_mw = 1.0;   // P_PQ, MW per Hz of deviation
    double efficiency_charge = 0.9;       // eta_ch
    double efficiency_discharge = 0.9;    // eta_dis
    double self_consumption_mwh_per_s = 3.85e-8;  // delta_E_SC

    // --- SOC management
    double initial_soc_pct = 40.0;
    SocLimits schedule_tx_limits{39.0, 41.0};
    SocLimits overfulfillment_limits{50.0, 50.0};
    SocLimits deadband_limits{50.0, 50.0};
    bool use_overfulfillment = false;
    bool use_deadband_utilization = false;

    // --- Schedule transactions
    double schedule_tx_power_mw = 0.5;    // P_ST
    double contract_duration_h = 0.5;
    double lead_time_h = 0.75;

    double initial_energy_mwh() const { return capacity_mwh * initial_soc_pct / 100.0; }
    double soc_pct(double energy_mwh) const { return energy_mwh / capacity_mwh * 100.0; }
};

} // namespace plant
