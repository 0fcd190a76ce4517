// src/sim/simulation_engine.cpp
#include "sim/simulation_engine.hpp"
#include "sim/sim_errors.hpp"
#include "plant/energy_balance.hpp"
#include "plant/metrics.hpp"
#include "plant/power_flow_model.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <string>

namespace sim {

namespace {

// Keeps the transaction log in the results and forwards events to the
// caller's observer.
class TransactionRecorder : public plant::TransactionObserver {
public:
    TransactionRecorder(std::vector<TransactionRecord>& log,
                        plant::TransactionObserver* downstream)
        : log_(log), downstream_(downstream) {}

    void on_scheduled(const plant::Transaction& tx, double t_s) override {
        TransactionRecord rec;
        rec.type = tx.type;
        rec.scheduled_at_s = t_s;
        rec.start_time_s = tx.start_time_s;
        rec.end_time_s = tx.end_time_s;
        log_.push_back(rec);
        if (downstream_) downstream_->on_scheduled(tx, t_s);
    }

    void on_activated(const plant::Transaction& tx, double t_s) override {
        if (!log_.empty()) log_.back().activated = true;
        if (downstream_) downstream_->on_activated(tx, t_s);
    }

    void on_completed(const plant::Transaction& tx, double t_s) override {
        if (!log_.empty()) log_.back().completed = true;
        if (downstream_) downstream_->on_completed(tx, t_s);
    }

private:
    std::vector<TransactionRecord>& log_;
    plant::TransactionObserver* downstream_;
};

} // namespace

SimulationEngine::SimulationEngine(const plant::BessParams& params,
                                   plant::TransactionObserver* observer)
    : params_(params),
      observer_(observer)
{
}

void SimulationEngine::validate_inputs(const std::vector<double>& frequency_hz,
                                       const std::vector<double>& time_s) {
    if (frequency_hz.size() != time_s.size()) {
        throw InputShapeError(
            "Frequency data and time vector must have same length (" +
            std::to_string(frequency_hz.size()) + " vs " +
            std::to_string(time_s.size()) + ")");
    }
    if (time_s.size() < 2) {
        throw InputShapeError("At least two samples are required, got " +
                              std::to_string(time_s.size()));
    }
    for (size_t k = 1; k < time_s.size(); ++k) {
        if (!(time_s[k] > time_s[k - 1])) {
            throw InputShapeError("Time vector must be strictly increasing (index " +
                                  std::to_string(k) + ")");
        }
    }
}

SimulationResults SimulationEngine::run(const std::vector<double>& frequency_hz,
                                        const std::vector<double>& time_s) const {
    validate_inputs(frequency_hz, time_s);

    const size_t n_steps = time_s.size();
    const double capacity_mwh = params_.capacity_mwh;

    SimulationResults res;
    res.resize(n_steps);

    TransactionRecorder recorder(res.transactions, observer_);

    const plant::PowerFlowModel flow_model(params_);
    const plant::TransactionScheduler scheduler(params_, &recorder);
    const plant::EnergyBalance balance(capacity_mwh);

    double energy_mwh = params_.initial_energy_mwh();
    plant::Transaction tx;

    res.time_s[0] = time_s[0];
    res.frequency_hz[0] = frequency_hz[0];
    res.soc_pct[0] = params_.initial_soc_pct;
    res.e_rate[0] = 0.0;

    LOG_INFO("[SimulationEngine] Running %zu steps (%.0f s), C=%.2f MWh, initial SOC=%.1f%%",
             n_steps, time_s.back() - time_s.front(), capacity_mwh, params_.initial_soc_pct);

    for (size_t k = 1; k < n_steps; ++k) {
        const double t = time_s[k];
        const double dt_s = t - time_s[k - 1];

        // Flows use the snapshot from the previous step
        const plant::PowerFlowResult step = flow_model.compute(frequency_hz[k], t, energy_mwh, tx, dt_s);

        tx = scheduler.advance(tx, t, energy_mwh);

        energy_mwh = balance.commit(energy_mwh, step.flows, res.flows, k);

        res.time_s[k] = t;
        res.frequency_hz[k] = frequency_hz[k];
        res.soc_pct[k] = energy_mwh / capacity_mwh * 100.0;
        res.e_rate[k] = std::abs(step.current_power_mw) / capacity_mwh;
        res.tx_state[k] = tx.state;
    }

    const plant::MetricsCalculator metrics(capacity_mwh);
    res.metrics = metrics.compute(res.flows);

    LOG_INFO("[SimulationEngine] Done: final SOC=%.2f%%, FCE=%.4f, %zu transactions",
             res.final_soc_pct(), res.metrics.fce, res.transactions.size());

    return res;
}

} // namespace sim
