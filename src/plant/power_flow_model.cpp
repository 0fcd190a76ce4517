// src/plant/power_flow_model.cpp
#include "plant/power_flow_model.hpp"
#include "utils/logging.hpp"

namespace plant {

namespace {
constexpr double kSecondsPerHour = 3600.0;
constexpr double kOverfulfillmentShare = 0.2;
}

PowerFlowModel::PowerFlowModel(const BessParams& params) : params_(params) {}

double PowerFlowModel::primary_control_power_mw(double frequency_hz) const {
    const double delta_f = params_.nominal_frequency_hz - frequency_hz;
    const double p_grid_mw = params_.prequalified_power_mw * delta_f;

    // Charging mode: grid pushes energy in, losses reduce what is stored
    if (p_grid_mw < 0.0) {
        return -params_.efficiency_charge * p_grid_mw;
    }
    return p_grid_mw / params_.efficiency_discharge;
}

double PowerFlowModel::schedule_tx_flow_mwh(double t_s, const Transaction& tx, double dt_s) const {
    if (!tx.delivering_at(t_s)) {
        return 0.0;
    }

    if (tx.type == TransactionType::Charge) {
        const double grid_energy_mwh = params_.schedule_tx_power_mw * dt_s / kSecondsPerHour;
        return grid_energy_mwh * params_.efficiency_charge;
    }

    // Discharge: more leaves the battery than reaches the grid
    const double battery_energy_mwh = -params_.schedule_tx_power_mw * dt_s / kSecondsPerHour;
    return battery_energy_mwh / params_.efficiency_discharge;
}

double PowerFlowModel::overfulfillment_flow_mwh(double frequency_hz,
                                                double soc_pct,
                                                double primary_mwh) const {
    if (!params_.use_overfulfillment) {
        return 0.0;
    }

    const double fn = params_.nominal_frequency_hz;
    const SocLimits& lim = params_.overfulfillment_limits;

    if ((soc_pct <= lim.low_pct && frequency_hz > fn) ||
        (soc_pct >= lim.high_pct && frequency_hz < fn)) {
        return kOverfulfillmentShare * primary_mwh;
    }
    return 0.0;
}

bool PowerFlowModel::in_deadband(double frequency_hz) const {
    const double fn = params_.nominal_frequency_hz;
    return frequency_hz >= fn - params_.deadband_hz && frequency_hz <= fn + params_.deadband_hz;
}

double PowerFlowModel::deadband_flow_mwh(double frequency_hz,
                                         double soc_pct,
                                         double primary_mwh) const {
    if (!params_.use_deadband_utilization || !in_deadband(frequency_hz)) {
        return 0.0;
    }

    const double fn = params_.nominal_frequency_hz;
    const SocLimits& lim = params_.deadband_limits;

    if ((soc_pct <= lim.low_pct && frequency_hz < fn) ||
        (soc_pct >= lim.high_pct && frequency_hz > fn)) {
        return -primary_mwh;
    }
    return 0.0;
}

double PowerFlowModel::self_consumption_flow_mwh(double dt_s) const {
    // Rate is already per second
    return -params_.self_consumption_mwh_per_s * dt_s;
}

PowerFlowResult PowerFlowModel::compute(double frequency_hz,
                                        double t_s,
                                        double energy_mwh,
                                        const Transaction& tx,
                                        double dt_s) const {
    PowerFlowResult out;
    const double soc_pct = params_.soc_pct(energy_mwh);

    const double p_pc_mw = primary_control_power_mw(frequency_hz);
    StepFlows& flows = out.flows;

    flows.primary_control_mwh = p_pc_mw * dt_s / kSecondsPerHour;
    flows.schedule_tx_mwh = schedule_tx_flow_mwh(t_s, tx, dt_s);
    flows.overfulfillment_mwh = overfulfillment_flow_mwh(frequency_hz, soc_pct, flows.primary_control_mwh);
    flows.deadband_util_mwh = deadband_flow_mwh(frequency_hz, soc_pct, flows.primary_control_mwh);
    flows.self_consumption_mwh = self_consumption_flow_mwh(dt_s);

    out.current_power_mw = p_pc_mw;
    if (tx.delivering_at(t_s)) {
        out.current_power_mw += tx.sign() * params_.schedule_tx_power_mw;
    }

    LOG_TRACE("[PowerFlowModel] t=%.1f f=%.4f SOC=%.2f%% P_PC=%.4f MW ST=%.6f OF=%.6f DU=%.6f MWh",
              t_s, frequency_hz, soc_pct, p_pc_mw,
              flows.schedule_tx_mwh, flows.overfulfillment_mwh, flows.deadband_util_mwh);

    return out;
}

} // namespace plant
