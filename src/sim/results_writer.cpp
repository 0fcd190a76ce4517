// src/sim/results_writer.cpp
#include "sim/results_writer.hpp"
#include "sim/field_visitor.hpp"
#include "utils/logging.hpp"

#include <fstream>
#include <iomanip>

namespace sim {

void write_results_csv(std::ostream& out, const SimulationResults& res) {
    if (res.size() == 0) return;

    const std::vector<std::string> columns = field_names(res, 0);
    for (size_t i = 0; i < columns.size(); ++i) {
        out << (i ? "," : "") << columns[i];
    }
    out << "\n";

    out << std::setprecision(10);
    for (size_t k = 0; k < res.size(); ++k) {
        bool first = true;
        auto row = make_visitor([&](const char*, double value) {
            if (!first) out << ",";
            out << value;
            first = false;
        });
        res.accept_step(k, row);
        out << "\n";
    }
}

bool write_results_csv(const std::string& path, const SimulationResults& res) {
    std::ofstream csv(path);
    if (!csv) {
        LOG_ERROR("Failed to open CSV: %s", path.c_str());
        return false;
    }
    write_results_csv(csv, res);
    if (!csv) {
        LOG_ERROR("Failed to write CSV: %s", path.c_str());
        return false;
    }
    LOG_INFO("Results CSV written to: %s (%zu rows)", path.c_str(), res.size());
    return true;
}

void log_results_summary(const SimulationResults& res) {
    const plant::PerformanceMetrics& m = res.metrics;

    size_t activated = 0;
    for (const auto& tx : res.transactions) {
        if (tx.activated) ++activated;
    }

    LOG_INFO("========================================");
    LOG_INFO("Simulation Results");
    LOG_INFO("========================================");
    LOG_INFO("Steps: %zu, final SOC: %.2f%%", res.size(), res.final_soc_pct());
    LOG_INFO("Full cycle equivalents: %.4f", m.fce);
    LOG_INFO("Schedule transactions: %zu scheduled, %zu activated", res.transactions.size(), activated);
    LOG_INFO("  ST charged:    %.4f MWh", m.schedule_tx_energy.charged_mwh);
    LOG_INFO("  ST discharged: %.4f MWh", m.schedule_tx_energy.discharged_mwh);
    LOG_INFO("Total charged:    %.4f MWh (%.2f%% via ST)",
             m.total_energy.charged_mwh, m.energy_shares.pct_charged_via_st);
    LOG_INFO("Total discharged: %.4f MWh (%.2f%% via ST)",
             m.total_energy.discharged_mwh, m.energy_shares.pct_discharged_via_st);
    LOG_INFO("========================================");
}

} // namespace sim
