// src/plant/transaction.hpp
#pragma once

namespace plant {

enum class TransactionState : int {
    Idle = 0,       // nothing pending
    Scheduled = 1,  // announced, waiting for start_time_s
    Active = 2      // delivering inside [start_time_s, end_time_s]
};

enum class TransactionType : int {
    None = 0,
    Charge = 1,
    Discharge = -1
};

inline const char* to_string(TransactionState s) {
    switch (s) {
        case TransactionState::Idle:      return "idle";
        case TransactionState::Scheduled: return "scheduled";
        case TransactionState::Active:    return "active";
    }
    return "unknown";
}

inline const char* to_string(TransactionType t) {
    switch (t) {
        case TransactionType::Charge:    return "charge";
        case TransactionType::Discharge: return "discharge";
        default:                         return "none";
    }
}

/**
 * Transaction - the single schedule transaction tracked by a simulation
 *
 * Value type: TransactionScheduler returns a new snapshot each step, so
 * callers can hold on to the pre-transition snapshot for power-flow
 * calculation.
 */
struct Transaction {
    TransactionState state = TransactionState::Idle;
    TransactionType type = TransactionType::None;
    double power_mw = 0.0;
    double start_time_s = 0.0;
    double end_time_s = 0.0;

    bool idle() const { return state == TransactionState::Idle; }
    bool scheduled() const { return state == TransactionState::Scheduled; }
    bool active() const { return state == TransactionState::Active; }

    // +1 charge, -1 discharge, 0 none
    int sign() const { return static_cast<int>(type); }

    // True when the transaction contributes energy at time t_s.
    bool delivering_at(double t_s) const {
        return active() && t_s >= start_time_s && t_s <= end_time_s;
    }
};

} // namespace plant
