// src/plant/power_flow_model.hpp
#pragma once

#include "plant/bess_params.hpp"
#include "plant/transaction.hpp"

namespace plant {

// Energy flows into the battery over one step [MWh]. Positive = stored energy increases.
struct StepFlows {
    double primary_control_mwh = 0.0;
    double overfulfillment_mwh = 0.0;
    double deadband_util_mwh = 0.0;
    double schedule_tx_mwh = 0.0;
    double self_consumption_mwh = 0.0;

    double net_mwh() const {
        return primary_control_mwh + overfulfillment_mwh + deadband_util_mwh +
               schedule_tx_mwh + self_consumption_mwh;
    }

    template<typename Visitor>
    void accept_fields(Visitor& visitor) const {
        visitor.visit("primary_control_mwh", primary_control_mwh);
        visitor.visit("overfulfillment_mwh", overfulfillment_mwh);
        visitor.visit("deadband_util_mwh", deadband_util_mwh);
        visitor.visit("schedule_tx_mwh", schedule_tx_mwh);
        visitor.visit("self_consumption_mwh", self_consumption_mwh);
    }
};

struct PowerFlowResult {
    StepFlows flows;
    double current_power_mw = 0.0;  // P_PC plus signed transaction power when delivering
};

/**
 * PowerFlowModel - Per-step PCR power flow calculation
 *
 * Pure function of (frequency, time, stored energy, transaction snapshot, dt).
 * Contributions:
 *   1. Primary control response   P_PQ * (fn - f), efficiency-weighted
 *   2. Schedule transaction       only while the snapshot is delivering
 *   3. Overfulfillment (optional) +20% of the primary response near SOC limits
 *   4. Deadband utilization (opt) cancels the primary response inside the deadband
 *   5. Self-consumption           constant drain
 *
 * The SOC used for the OF/DU conditions is derived from the energy passed in,
 * i.e. the value before this step's energy update.
 */
class PowerFlowModel {
public:
    explicit PowerFlowModel(const BessParams& params);

    PowerFlowResult compute(double frequency_hz,
                            double t_s,
                            double energy_mwh,
                            const Transaction& tx,
                            double dt_s) const;

    // Individual contributions, exposed for unit tests.
    double primary_control_power_mw(double frequency_hz) const;
    double schedule_tx_flow_mwh(double t_s, const Transaction& tx, double dt_s) const;
    double overfulfillment_flow_mwh(double frequency_hz, double soc_pct, double primary_mwh) const;
    double deadband_flow_mwh(double frequency_hz, double soc_pct, double primary_mwh) const;
    double self_consumption_flow_mwh(double dt_s) const;

    bool in_deadband(double frequency_hz) const;

private:
    BessParams params_;
};

} // namespace plant
