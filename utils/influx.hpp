// utils/influx.hpp
#pragma once

#include "sim/sim_results.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB Client for exporting BESS simulation results
 *
 * Rows are thinned to one point per write_interval_s of simulated time,
 * buffered, and posted to the v2 write API in batches of batch_lines.
 * Points are stamped with (export start wall clock + simulated time) so a
 * run shows up as "recent" data in the InfluxDB UI.
 *
 * Measurement schema (tag: run=<run_tag>):
 *   - bess_state:   soc_pct, e_rate, frequency_hz, tx_state
 *   - bess_flows:   the five per-step energy flows [MWh]
 *   - bess_summary: FCE, ST energy, totals, shares, transaction count
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "Grid";                    // Organization name
        std::string bucket = "bess-pcr";             // Bucket name
        std::string run_tag = "default";             // value of the "run" tag
        double write_interval_s = 60.0;              // simulated seconds between points
        size_t batch_lines = 5000;                   // lines per HTTP request
        bool enabled = false;                        // Only enabled with --influx flag
    };

    /**
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    /**
     * Destructor - flushes any pending lines
     */
    ~InfluxClient();

    InfluxClient(const InfluxClient&) = delete;
    InfluxClient& operator=(const InfluxClient&) = delete;

    /**
     * Buffer step k of a run
     * @return true if the step was buffered, false if disabled or rate limited
     */
    bool write_step(const sim::SimulationResults& res, size_t k, int64_t base_ns);

    /**
     * Buffer the summary point of a run
     */
    bool write_summary(const sim::SimulationResults& res, int64_t timestamp_ns);

    /**
     * Export a whole run (thinned steps + summary) and flush
     * @return number of steps buffered
     */
    size_t export_results(const sim::SimulationResults& res);

    /**
     * Post buffered lines
     * @return false if the HTTP write failed (lines are dropped either way)
     */
    bool flush();

    bool is_enabled() const { return config_.enabled; }

    size_t pending_lines() const { return pending_count_; }
    size_t failed_writes() const { return failed_writes_; }

    // Line protocol builders (match CSV field names)
    std::string build_state_line(const sim::SimulationResults& res, size_t k, int64_t timestamp_ns) const;
    std::string build_flows_line(const sim::SimulationResults& res, size_t k, int64_t timestamp_ns) const;
    std::string build_summary_line(const sim::SimulationResults& res, int64_t timestamp_ns) const;

    static std::string escape_tag(const std::string& value);
    static int64_t wall_clock_time_ns();
    static int64_t sim_time_to_ns(double sim_time_s);

private:
    Config config_;
    bool has_written_ = false;
    double last_write_time_ = 0.0;

    std::string pending_;
    size_t pending_count_ = 0;
    size_t failed_writes_ = 0;
    size_t successful_writes_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void append_line(const std::string& line);
    bool send_to_influx(const std::string& line_protocol);
};

} // namespace utils
