// src/plant/transaction_scheduler.cpp
#include "plant/transaction_scheduler.hpp"
#include "utils/logging.hpp"

namespace plant {

namespace {
constexpr double kSecondsPerHour = 3600.0;

const char* type_label(const Transaction& tx) {
    return tx.type == TransactionType::Charge ? "Charging" : "Discharging";
}
}

// ============================================================================
// LoggingTransactionObserver
// ============================================================================

void LoggingTransactionObserver::on_scheduled(const Transaction& tx, double t_s) {
    LOG_INFO("%s transaction scheduled at t = %.0f s (window %.0f..%.0f s, %.2f MW)",
             type_label(tx), t_s, tx.start_time_s, tx.end_time_s, tx.power_mw);
}

void LoggingTransactionObserver::on_activated(const Transaction& tx, double t_s) {
    LOG_INFO("%s transaction activated at t = %.0f s", type_label(tx), t_s);
}

void LoggingTransactionObserver::on_completed(const Transaction& tx, double t_s) {
    LOG_INFO("%s transaction completed at t = %.0f s", type_label(tx), t_s);
}

// ============================================================================
// TransactionScheduler
// ============================================================================

TransactionScheduler::TransactionScheduler(const BessParams& params,
                                           TransactionObserver* observer)
    : params_(params),
      observer_(observer)
{
}

Transaction TransactionScheduler::schedule(TransactionType type, double t_s) const {
    Transaction tx;
    tx.state = TransactionState::Scheduled;
    tx.type = type;
    tx.power_mw = params_.schedule_tx_power_mw;
    tx.start_time_s = t_s + params_.lead_time_h * kSecondsPerHour;
    tx.end_time_s = tx.start_time_s + params_.contract_duration_h * kSecondsPerHour;
    return tx;
}

Transaction TransactionScheduler::advance(const Transaction& current,
                                          double t_s,
                                          double energy_mwh) const {
    Transaction next = current;

    switch (current.state) {
        case TransactionState::Active:
            if (t_s > current.end_time_s) {
                next.state = TransactionState::Idle;
                if (observer_) observer_->on_completed(next, t_s);
            }
            break;

        case TransactionState::Idle: {
            const double soc_pct = params_.soc_pct(energy_mwh);
            const SocLimits& lim = params_.schedule_tx_limits;

            if (soc_pct <= lim.low_pct) {
                next = schedule(TransactionType::Charge, t_s);
            } else if (soc_pct >= lim.high_pct) {
                next = schedule(TransactionType::Discharge, t_s);
            } else {
                break;
            }

            LOG_DEBUG("[TransactionScheduler] SOC=%.3f%% crossed [%.1f, %.1f] at t=%.0f s",
                      soc_pct, lim.low_pct, lim.high_pct, t_s);
            if (observer_) observer_->on_scheduled(next, t_s);
            break;
        }

        case TransactionState::Scheduled:
            if (t_s >= current.start_time_s) {
                next.state = TransactionState::Active;
                if (observer_) observer_->on_activated(next, t_s);
            }
            break;
    }

    return next;
}

} // namespace plant
