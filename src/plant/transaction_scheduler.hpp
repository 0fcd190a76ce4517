// src/plant/transaction_scheduler.hpp
#pragma once

#include "plant/bess_params.hpp"
#include "plant/transaction.hpp"

namespace plant {

/**
 * TransactionObserver - Event sink for schedule transaction life-cycle
 *
 * All hooks default to no-op. Implementations must not mutate the
 * simulation; they receive copies of the new snapshot.
 */
class TransactionObserver {
public:
    virtual ~TransactionObserver() = default;

    virtual void on_scheduled(const Transaction& tx, double t_s) {
        (void)tx; (void)t_s;
    }

    virtual void on_activated(const Transaction& tx, double t_s) {
        (void)tx; (void)t_s;
    }

    virtual void on_completed(const Transaction& tx, double t_s) {
        (void)tx; (void)t_s;
    }
};

/**
 * LoggingTransactionObserver - Writes life-cycle events to the project log
 */
class LoggingTransactionObserver : public TransactionObserver {
public:
    void on_scheduled(const Transaction& tx, double t_s) override;
    void on_activated(const Transaction& tx, double t_s) override;
    void on_completed(const Transaction& tx, double t_s) override;
};

/**
 * TransactionScheduler - Idle -> Scheduled -> Active -> Idle state machine
 *
 * Exactly one transition is evaluated per call:
 *   Active    -> Idle       when t > end_time
 *   Idle      -> Scheduled  when SOC <= ST_low (charge) or SOC >= ST_high (discharge)
 *   Scheduled -> Active     when t >= start_time
 *
 * start_time = t + lead_time, end_time = start_time + contract_duration.
 *
 * Callers pass the stored energy used for this step's flow calculation
 * (before the energy update) and must compute power flows with the
 * snapshot from before this call.
 */
class TransactionScheduler {
public:
    explicit TransactionScheduler(const BessParams& params,
                                  TransactionObserver* observer = nullptr);

    Transaction advance(const Transaction& current, double t_s, double energy_mwh) const;

private:
    Transaction schedule(TransactionType type, double t_s) const;

    BessParams params_;
    TransactionObserver* observer_;
};

} // namespace plant
