// test/test_metrics.cpp
// Unit tests for post-run performance metrics

#include "plant/metrics.hpp"
#include <iostream>
#include <cmath>

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

static bool near(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

// Four steps with every flow kind exercised in both directions
static plant::FlowHistory mixed_history() {
    plant::FlowHistory h(4);
    h.primary_control_mwh = {0.0, 0.1, -0.2, 0.3};
    h.overfulfillment_mwh = {0.0, 0.02, 0.0, -0.01};
    h.deadband_util_mwh   = {0.0, 0.0, -0.1, 0.0};
    h.schedule_tx_mwh     = {0.0, 0.05, -0.04, 0.0};
    h.self_consumption_mwh = {0.0, -0.001, -0.001, -0.001};
    return h;
}

// ============================================================================
// Test Cases
// ============================================================================

bool test_zero_history() {
    plant::MetricsCalculator calc(2.0);
    plant::PerformanceMetrics m = calc.compute(plant::FlowHistory(10));

    TEST_ASSERT(m.fce == 0.0, "FCE is zero for no throughput");
    TEST_ASSERT(m.schedule_tx_energy.charged_mwh == 0.0, "No ST charge");
    TEST_ASSERT(m.schedule_tx_energy.discharged_mwh == 0.0, "No ST discharge");
    TEST_ASSERT(m.energy_shares.pct_charged_via_st == 0.0, "Share guarded against 0/0");
    TEST_ASSERT(m.energy_shares.pct_discharged_via_st == 0.0, "Share guarded against 0/0");
    return true;
}

bool test_fce() {
    plant::MetricsCalculator calc(2.0);
    plant::PerformanceMetrics m = calc.compute(mixed_history());

    // (0.6 + 0.03 + 0.1 + 0.09) / (2 * 2)
    TEST_ASSERT(near(m.fce, 0.205), "FCE = 0.205, got " << m.fce);
    return true;
}

bool test_self_consumption_excluded() {
    plant::FlowHistory h(3);
    h.self_consumption_mwh = {0.0, -1.0, -1.0};

    plant::MetricsCalculator calc(2.0);
    plant::PerformanceMetrics m = calc.compute(h);

    TEST_ASSERT(m.fce == 0.0, "Self-consumption does not count toward FCE");
    TEST_ASSERT(m.total_energy.discharged_mwh == 0.0, "Self-consumption is not discharged energy");
    return true;
}

bool test_schedule_tx_energy() {
    plant::MetricsCalculator calc(2.0);
    plant::PerformanceMetrics m = calc.compute(mixed_history());

    TEST_ASSERT(near(m.schedule_tx_energy.charged_mwh, 0.05), "ST charged 0.05 MWh");
    TEST_ASSERT(near(m.schedule_tx_energy.discharged_mwh, 0.04), "ST discharged 0.04 MWh (positive)");
    return true;
}

bool test_total_energy_excludes_deadband() {
    plant::MetricsCalculator calc(2.0);
    plant::PerformanceMetrics m = calc.compute(mixed_history());

    // PC 0.4 + OF 0.02 + ST 0.05
    TEST_ASSERT(near(m.total_energy.charged_mwh, 0.47), "Total charged 0.47, got " << m.total_energy.charged_mwh);
    // PC 0.2 + OF 0.01 + ST 0.04, DU excluded
    TEST_ASSERT(near(m.total_energy.discharged_mwh, 0.25), "Total discharged 0.25, got " << m.total_energy.discharged_mwh);
    return true;
}

bool test_energy_shares() {
    plant::MetricsCalculator calc(2.0);
    plant::PerformanceMetrics m = calc.compute(mixed_history());

    TEST_ASSERT(near(m.energy_shares.pct_charged_via_st, 0.05 / 0.47 * 100.0, 1e-9),
                "Charged share " << m.energy_shares.pct_charged_via_st);
    TEST_ASSERT(near(m.energy_shares.pct_discharged_via_st, 16.0, 1e-9),
                "Discharged share " << m.energy_shares.pct_discharged_via_st);
    return true;
}

bool test_shares_guarded_independently() {
    plant::FlowHistory h(3);
    h.primary_control_mwh = {0.0, 0.2, 0.1};
    h.schedule_tx_mwh = {0.0, 0.1, 0.0};

    plant::MetricsCalculator calc(1.0);
    plant::PerformanceMetrics m = calc.compute(h);

    TEST_ASSERT(near(m.energy_shares.pct_charged_via_st, 25.0, 1e-9), "Charged share 25%");
    TEST_ASSERT(m.energy_shares.pct_discharged_via_st == 0.0, "No discharge -> share 0");
    TEST_ASSERT(near(m.fce, 0.2), "FCE 0.4 / 2");
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "MetricsCalculator Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_zero_history);
    RUN_TEST(test_fce);
    RUN_TEST(test_self_consumption_excluded);
    RUN_TEST(test_schedule_tx_energy);
    RUN_TEST(test_total_energy_excludes_deadband);
    RUN_TEST(test_energy_shares);
    RUN_TEST(test_shares_guarded_independently);

    std::cout << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    }
    std::cout << "✗ Some tests failed!" << std::endl;
    return 1;
}
