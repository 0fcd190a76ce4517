// test/test_bess_config.cpp
/**
 * Unit Test: BessConfig
 *
 * Tests YAML loading, validation, and default configuration.
 *
 * Test Coverage:
 *   1. Default configuration generation
 *   2. Valid YAML loading
 *   3. Missing file fallback to defaults
 *   4. Missing required parameter
 *   5. Parameter validation (efficiency, SOC limits, capacity)
 *   6. Optional keys
 *   7. Malformed YAML
 */

#include "config/bess_config.hpp"
#include <iostream>
#include <fstream>
#include <cmath>
#include <cstdio>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 0.0001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

// Complete document; tests derive broken variants from it
static const char* kValidYaml = R"(
bess:
  name: "Test BESS"
  description: "Unit test unit"
  system:
    nominal_frequency_hz: 50.0
    capacity_mwh: 4.0
    prequalified_power_mw: 2.0
    efficiency_charge: 0.95
    efficiency_discharge: 0.92
    self_consumption_mwh_per_s: 1.0e-7
  soc_management:
    initial_soc_pct: 55.0
    schedule_transaction_limits_pct: [30.0, 70.0]
    overfulfillment_limits_pct: [45.0, 55.0]
    deadband_limits_pct: [40.0, 60.0]
    use_overfulfillment: true
  schedule_transaction:
    power_mw: 1.0
    contract_duration_h: 0.25
    lead_time_h: 0.5
)";

static std::string replace(std::string text, const std::string& from, const std::string& to) {
    const size_t pos = text.find(from);
    if (pos != std::string::npos) text.replace(pos, from.size(), to);
    return text;
}

// Expect parse() to throw ConfigError whose message mentions `needle`
static void expect_config_error(TestResult& result, const std::string& yaml,
                                const std::string& needle, const std::string& label) {
    try {
        config::BessConfig::parse(yaml);
        result.fail(label + ": should have thrown");
    } catch (const config::ConfigError& e) {
        const std::string msg = e.what();
        if (msg.find(needle) != std::string::npos) {
            result.pass(label + ": " + msg);
        } else {
            result.fail(label + ": wrong message: " + msg);
        }
    }
}

// Test 1: Default configuration
void test_default_config(TestResult& result) {
    std::cout << "\n=== Test 1: Default Configuration ===\n";

    config::BessConfig cfg = config::BessConfig::get_default();

    if (cfg.params.capacity_mwh == 2.0 && cfg.params.prequalified_power_mw == 1.0) {
        result.pass("Reference capacity 2 MWh, P_PQ 1 MW");
    } else {
        result.fail("Reference sizing mismatch");
    }

    if (cfg.params.nominal_frequency_hz == 60.0 && cfg.params.deadband_hz == 0.01) {
        result.pass("60 Hz grid with 10 mHz deadband");
    } else {
        result.fail("Grid defaults mismatch");
    }

    if (cfg.params.schedule_tx_limits.low_pct == 39.0 && cfg.params.schedule_tx_limits.high_pct == 41.0) {
        result.pass("ST limits [39, 41]%");
    } else {
        result.fail("ST limits mismatch");
    }

    if (!cfg.params.use_overfulfillment && !cfg.params.use_deadband_utilization) {
        result.pass("OF and DU disabled by default");
    } else {
        result.fail("OF/DU defaults mismatch");
    }

    try {
        cfg.validate();
        result.pass("Default configuration validates");
    } catch (const config::ConfigError& e) {
        result.fail(std::string("Default configuration invalid: ") + e.what());
    }
}

// Test 2: Valid YAML loading
void test_valid_yaml(TestResult& result) {
    std::cout << "\n=== Test 2: Valid YAML Loading ===\n";

    const char* temp_yaml = "/tmp/test_bess_valid.yaml";
    std::ofstream yaml_file(temp_yaml);
    yaml_file << kValidYaml;
    yaml_file.close();

    try {
        config::BessConfig cfg = config::BessConfig::load(temp_yaml);

        if (cfg.name == "Test BESS") {
            result.pass("Name loaded correctly: " + cfg.name);
        } else {
            result.fail("Name mismatch");
        }

        if (is_close(cfg.params.capacity_mwh, 4.0) && is_close(cfg.params.prequalified_power_mw, 2.0)) {
            result.pass("Sizing loaded correctly");
        } else {
            result.fail("Sizing mismatch");
        }

        if (is_close(cfg.params.efficiency_charge, 0.95) && is_close(cfg.params.efficiency_discharge, 0.92)) {
            result.pass("Efficiencies loaded correctly");
        } else {
            result.fail("Efficiency mismatch");
        }

        if (is_close(cfg.params.overfulfillment_limits.low_pct, 45.0) &&
            is_close(cfg.params.overfulfillment_limits.high_pct, 55.0) &&
            is_close(cfg.params.deadband_limits.low_pct, 40.0)) {
            result.pass("Limit pairs loaded correctly");
        } else {
            result.fail("Limit pair mismatch");
        }

        if (is_close(cfg.params.lead_time_h, 0.5) && is_close(cfg.params.contract_duration_h, 0.25)) {
            result.pass("Transaction timing loaded correctly");
        } else {
            result.fail("Transaction timing mismatch");
        }

        if (cfg.params.use_overfulfillment && !cfg.params.use_deadband_utilization) {
            result.pass("Flags loaded, absent flag defaults to false");
        } else {
            result.fail("Flag mismatch");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }

    std::remove(temp_yaml);
}

// Test 3: Missing file fallback
void test_missing_file(TestResult& result) {
    std::cout << "\n=== Test 3: Missing File Fallback ===\n";

    const char* missing_file = "/tmp/nonexistent_bess_config.yaml";

    try {
        config::BessConfig cfg = config::BessConfig::load(missing_file);
        if (cfg.params.capacity_mwh == 2.0 && cfg.params.initial_soc_pct == 40.0) {
            result.pass("Missing file correctly fell back to defaults");
        } else {
            result.fail("Fallback defaults are invalid");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }
}

// Test 4: Missing required parameters
void test_missing_required(TestResult& result) {
    std::cout << "\n=== Test 4: Missing Required Parameter ===\n";

    expect_config_error(result,
                        replace(kValidYaml, "    capacity_mwh: 4.0\n", ""),
                        "capacity_mwh", "Missing capacity_mwh");
    expect_config_error(result,
                        replace(kValidYaml, "    lead_time_h: 0.5\n", ""),
                        "lead_time_h", "Missing lead_time_h");
    expect_config_error(result,
                        replace(kValidYaml, "    deadband_limits_pct: [40.0, 60.0]\n", ""),
                        "deadband_limits_pct", "Missing deadband_limits_pct");
    expect_config_error(result, "other:\n  key: 1\n", "bess", "Missing bess section");
}

// Test 5: Validation
void test_invalid_values(TestResult& result) {
    std::cout << "\n=== Test 5: Validation ===\n";

    expect_config_error(result,
                        replace(kValidYaml, "efficiency_charge: 0.95", "efficiency_charge: 1.2"),
                        "efficiency_charge", "Efficiency above 1");
    expect_config_error(result,
                        replace(kValidYaml, "capacity_mwh: 4.0", "capacity_mwh: 0.0"),
                        "capacity_mwh", "Zero capacity");
    expect_config_error(result,
                        replace(kValidYaml, "[30.0, 70.0]", "[70.0, 30.0]"),
                        "schedule transaction", "Inverted ST limits");
    expect_config_error(result,
                        replace(kValidYaml, "[45.0, 55.0]", "[45.0]"),
                        "overfulfillment_limits_pct", "Limit pair with one value");
    expect_config_error(result,
                        replace(kValidYaml, "initial_soc_pct: 55.0", "initial_soc_pct: 120.0"),
                        "initial_soc_pct", "Initial SOC above 100");
}

// Test 6: NaN values
void test_nan_values(TestResult& result) {
    std::cout << "\n=== Test 6: NaN Values ===\n";

    expect_config_error(result,
                        replace(kValidYaml, "capacity_mwh: 4.0", "capacity_mwh: .nan"),
                        "capacity_mwh", "NaN capacity");
    expect_config_error(result,
                        replace(kValidYaml, "efficiency_charge: 0.95", "efficiency_charge: .nan"),
                        "efficiency_charge", "NaN efficiency");
    expect_config_error(result,
                        replace(kValidYaml, "initial_soc_pct: 55.0", "initial_soc_pct: .nan"),
                        "initial_soc_pct", "NaN initial SOC");
    expect_config_error(result,
                        replace(kValidYaml, "[30.0, 70.0]", "[.nan, 70.0]"),
                        "schedule transaction", "NaN ST limit");
}

// Test 7: Optional keys
void test_optional_keys(TestResult& result) {
    std::cout << "\n=== Test 7: Optional Keys ===\n";

    try {
        config::BessConfig cfg = config::BessConfig::parse(kValidYaml);
        if (cfg.params.deadband_hz == 0.01) {
            result.pass("deadband_hz defaults to 0.01 Hz");
        } else {
            result.fail("deadband_hz default mismatch");
        }

        config::BessConfig custom = config::BessConfig::parse(
            replace(kValidYaml, "    capacity_mwh: 4.0\n", "    capacity_mwh: 4.0\n    deadband_hz: 0.02\n"));
        if (is_close(custom.params.deadband_hz, 0.02)) {
            result.pass("deadband_hz read when present");
        } else {
            result.fail("deadband_hz not read");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }
}

// Test 8: Malformed YAML
void test_malformed_yaml(TestResult& result) {
    std::cout << "\n=== Test 8: Malformed YAML ===\n";

    expect_config_error(result,
                        replace(kValidYaml, "capacity_mwh: 4.0", "capacity_mwh: four"),
                        "YAML", "Non-numeric value");
    expect_config_error(result, "bess: [unterminated\n", "YAML", "Syntax error");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "BessConfig Unit Tests\n";
    std::cout << "========================================\n";

    TestResult result;

    test_default_config(result);
    test_valid_yaml(result);
    test_missing_file(result);
    test_missing_required(result);
    test_invalid_values(result);
    test_nan_values(result);
    test_optional_keys(result);
    test_malformed_yaml(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
