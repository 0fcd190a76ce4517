// src/sim/results_writer.hpp
#pragma once

#include "sim/sim_results.hpp"
#include <ostream>
#include <string>

namespace sim {

/**
 * Write one CSV row per step; columns follow SimulationResults::accept_step().
 */
void write_results_csv(std::ostream& out, const SimulationResults& res);

/**
 * @return false if the file cannot be opened or written
 */
bool write_results_csv(const std::string& path, const SimulationResults& res);

/**
 * Log the performance summary (FCE, ST energy, totals, shares, transactions).
 */
void log_results_summary(const SimulationResults& res);

} // namespace sim
