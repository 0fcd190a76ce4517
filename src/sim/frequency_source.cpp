// src/sim/frequency_source.cpp
#include "sim/frequency_source.hpp"
#include "sim/sim_errors.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/noise.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace sim {

namespace {
const char* kTimeCol = "time_s";
const char* kFreqCol = "frequency_hz";
}

FrequencySeries load_frequency_csv(const std::string& path) {
    utils::CsvReader reader;
    if (!reader.open(path)) {
        throw InputShapeError("Cannot read frequency CSV: " + path);
    }
    if (!reader.has_col(kTimeCol) || !reader.has_col(kFreqCol)) {
        throw InputShapeError("Frequency CSV " + path + " needs columns '" +
                              kTimeCol + "' and '" + kFreqCol + "'");
    }

    FrequencySeries series;
    std::vector<std::string> row;
    while (reader.read_row(row)) {
        const std::string t_cell = reader.get(row, kTimeCol);
        const std::string f_cell = reader.get(row, kFreqCol);
        if (t_cell.empty() || f_cell.empty()) {
            throw InputShapeError("Empty cell in " + path + " at line " +
                                  std::to_string(reader.line_number()));
        }
        try {
            series.time_s.push_back(utils::CsvReader::to_double(t_cell));
            series.frequency_hz.push_back(utils::CsvReader::to_double(f_cell));
        } catch (const std::exception& e) {
            throw InputShapeError("Non-numeric value in " + path + " at line " +
                                  std::to_string(reader.line_number()) + ": " + e.what());
        }
    }

    if (series.size() < 2) {
        throw InputShapeError("Frequency CSV " + path + " has fewer than two samples");
    }

    LOG_INFO("[FrequencySource] Loaded %zu samples from %s (%.0f s)",
             series.size(), path.c_str(), series.time_s.back() - series.time_s.front());
    return series;
}

bool save_frequency_csv(const std::string& path, const FrequencySeries& series) {
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("[FrequencySource] Failed to open %s for writing", path.c_str());
        return false;
    }
    out << kTimeCol << "," << kFreqCol << "\n";
    out << std::setprecision(10);
    for (size_t i = 0; i < series.size(); ++i) {
        out << series.time_s[i] << "," << series.frequency_hz[i] << "\n";
    }
    return static_cast<bool>(out);
}

std::vector<double> make_time_grid(double duration_s, double sample_rate_hz) {
    if (duration_s <= 0.0 || sample_rate_hz <= 0.0) {
        throw InputShapeError("Time grid needs duration > 0 and sample rate > 0");
    }
    const size_t n = static_cast<size_t>(std::floor(duration_s * sample_rate_hz + 1e-9)) + 1;

    std::vector<double> t(n);
    for (size_t i = 0; i < n; ++i) {
        t[i] = static_cast<double>(i) / sample_rate_hz;
    }
    return t;
}

FrequencySeries synthesize_frequency(const SyntheticFrequencyParams& p) {
    // seed 0 would make utils::NoiseGenerator draw from std::random_device
    if (p.seed == 0) {
        throw InputShapeError("Synthetic frequency seed must be > 0");
    }

    FrequencySeries series;
    series.time_s = make_time_grid(p.duration_s, p.sample_rate_hz);
    series.frequency_hz.resize(series.time_s.size());

    utils::GaussMarkov deviation(p.tau_s, p.sigma, p.seed);
    const utils::Quantizer meter(p.resolution_hz);
    const double dt = 1.0 / p.sample_rate_hz;

    series.frequency_hz[0] = p.nominal_frequency_hz;
    for (size_t i = 1; i < series.size(); ++i) {
        double df = deviation.step(dt);
        if (std::abs(df) > p.max_deviation_hz) {
            df = std::clamp(df, -p.max_deviation_hz, p.max_deviation_hz);
            deviation.set(df);
        }
        series.frequency_hz[i] = p.nominal_frequency_hz + meter.quantize(df);
    }

    LOG_INFO("[FrequencySource] Synthesized %zu samples (%.1f h @ %.2f Hz, seed %llu)",
             series.size(), p.duration_s / 3600.0, p.sample_rate_hz,
             static_cast<unsigned long long>(p.seed));
    return series;
}

} // namespace sim
