// src/sim/frequency_source.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sim {

// Paired grid-frequency / elapsed-time samples.
struct FrequencySeries {
    std::vector<double> time_s;
    std::vector<double> frequency_hz;

    size_t size() const { return time_s.size(); }
    bool empty() const { return time_s.empty(); }
};

struct SyntheticFrequencyParams {
    double nominal_frequency_hz = 60.0;
    double duration_s = 6.0 * 3600.0;   // 6 h
    double sample_rate_hz = 1.0;
    double tau_s = 60.0;                 // Gauss-Markov time constant
    double sigma = 0.004;                // white-noise strength [Hz/sqrt(s)]
    double max_deviation_hz = 0.2;       // clip |f - fn|
    double resolution_hz = 0.001;        // meter resolution, 0 = none
    uint64_t seed = 42;
};

/**
 * Load a frequency trace from CSV with header columns time_s, frequency_hz.
 * Lines starting with '#' and blank lines are skipped.
 *
 * @throws InputShapeError if the file cannot be read, a column is missing,
 *         a cell is not numeric, or fewer than two rows are present
 */
FrequencySeries load_frequency_csv(const std::string& path);

/**
 * Write a frequency trace in the format read by load_frequency_csv().
 * @return false if the file cannot be opened
 */
bool save_frequency_csv(const std::string& path, const FrequencySeries& series);

/**
 * Uniform time grid [0, duration] at sample_rate_hz (both ends included).
 */
std::vector<double> make_time_grid(double duration_s, double sample_rate_hz);

/**
 * Synthetic grid frequency: fn plus a clipped first-order Gauss-Markov
 * deviation, quantized to the meter resolution. Deterministic per seed.
 *
 * @throws InputShapeError if seed is 0 or the time grid is empty
 */
FrequencySeries synthesize_frequency(const SyntheticFrequencyParams& p);

} // namespace sim
