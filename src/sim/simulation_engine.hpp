// src/sim/simulation_engine.hpp
#pragma once

#include "plant/bess_params.hpp"
#include "plant/transaction_scheduler.hpp"
#include "sim/sim_results.hpp"

#include <vector>

namespace sim {

/**
 * SimulationEngine - Sequential PCR simulation over a frequency trace
 *
 * Per step k = 1..n-1:
 *   1. PowerFlowModel with the transaction snapshot carried from step k-1
 *   2. TransactionScheduler transition (used from step k+1 on)
 *   3. EnergyBalance commit and flow recording
 *   4. SOC / E-rate recording
 * MetricsCalculator runs once after the loop.
 *
 * Deterministic: the only state threaded between steps is (E, Transaction).
 */
class SimulationEngine {
public:
    explicit SimulationEngine(const plant::BessParams& params,
                              plant::TransactionObserver* observer = nullptr);

    /**
     * Run the simulation
     * @param frequency_hz Measured grid frequency per sample
     * @param time_s       Elapsed time per sample, strictly increasing
     * @throws InputShapeError if the series differ in length, have fewer than
     *         two samples, or time is not strictly increasing
     */
    SimulationResults run(const std::vector<double>& frequency_hz,
                          const std::vector<double>& time_s) const;

    static void validate_inputs(const std::vector<double>& frequency_hz,
                                const std::vector<double>& time_s);

    const plant::BessParams& params() const { return params_; }

private:
    plant::BessParams params_;
    plant::TransactionObserver* observer_;
};

} // namespace sim
