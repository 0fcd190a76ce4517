// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include "sim/field_visitor.hpp"
#include <curl/curl.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// Discard response body (only the HTTP status code matters)
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_DEBUG("[InfluxDB] Client created but disabled (use --influx flag to enable)");
        return;
    }

    // http://localhost:8086/api/v2/write?org=Grid&bucket=bess-pcr&precision=ns
    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s run=%s interval=%.0fs",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.run_tag.c_str(), config_.write_interval_s);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        flush();
        LOG_INFO("[InfluxDB] Client shutdown (%zu batches written, %zu failed)",
                 successful_writes_, failed_writes_);
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_step(const sim::SimulationResults& res, size_t k, int64_t base_ns) {
    if (!config_.enabled || k >= res.size()) {
        return false;
    }

    const double t = res.time_s[k];
    if (has_written_ && (t - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    has_written_ = true;
    last_write_time_ = t;

    const int64_t ts = base_ns + sim_time_to_ns(t - res.time_s.front());
    append_line(build_state_line(res, k, ts));
    append_line(build_flows_line(res, k, ts));
    return true;
}

bool InfluxClient::write_summary(const sim::SimulationResults& res, int64_t timestamp_ns) {
    if (!config_.enabled) {
        return false;
    }
    append_line(build_summary_line(res, timestamp_ns));
    return true;
}

size_t InfluxClient::export_results(const sim::SimulationResults& res) {
    if (!config_.enabled || res.size() == 0) {
        return 0;
    }

    const int64_t base_ns = wall_clock_time_ns();
    size_t written = 0;
    for (size_t k = 0; k < res.size(); ++k) {
        if (write_step(res, k, base_ns)) {
            ++written;
        }
    }
    write_summary(res, base_ns + sim_time_to_ns(res.time_s.back() - res.time_s.front()));
    flush();

    LOG_INFO("[InfluxDB] Exported %zu of %zu steps", written, res.size());
    return written;
}

bool InfluxClient::flush() {
    if (pending_count_ == 0) {
        return true;
    }
    const bool ok = send_to_influx(pending_);
    pending_.clear();
    pending_count_ = 0;
    return ok;
}

void InfluxClient::append_line(const std::string& line) {
    pending_ += line;
    pending_ += '\n';
    ++pending_count_;
    if (config_.batch_lines > 0 && pending_count_ >= config_.batch_lines) {
        flush();
    }
}

// ============================================================================
// Line Protocol Builders
// ============================================================================

std::string InfluxClient::escape_tag(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ' ' || c == ',' || c == '=') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string InfluxClient::build_state_line(const sim::SimulationResults& res,
                                           size_t k,
                                           int64_t timestamp_ns) const
{
    std::ostringstream line;
    line << std::setprecision(10);

    line << "bess_state,run=" << escape_tag(config_.run_tag);

    line << " "
         << "soc_pct=" << res.soc_pct.at(k) << ","
         << "e_rate=" << res.e_rate.at(k) << ","
         << "frequency_hz=" << res.frequency_hz.at(k) << ","
         << "tx_state=" << static_cast<int>(res.tx_state.at(k)) << "i";

    line << " " << timestamp_ns;

    return line.str();
}

std::string InfluxClient::build_flows_line(const sim::SimulationResults& res,
                                           size_t k,
                                           int64_t timestamp_ns) const
{
    std::ostringstream line;
    line << std::setprecision(10);

    line << "bess_flows,run=" << escape_tag(config_.run_tag) << " ";

    bool first = true;
    auto v = sim::make_visitor([&](const char* name, double value) {
        if (!first) line << ",";
        line << name << "=" << value;
        first = false;
    });
    res.flows.at(k).accept_fields(v);

    line << " " << timestamp_ns;

    return line.str();
}

std::string InfluxClient::build_summary_line(const sim::SimulationResults& res,
                                             int64_t timestamp_ns) const
{
    const plant::PerformanceMetrics& m = res.metrics;
    std::ostringstream line;
    line << std::setprecision(10);

    line << "bess_summary,run=" << escape_tag(config_.run_tag);

    line << " "
         << "fce=" << m.fce << ","
         << "st_charged_mwh=" << m.schedule_tx_energy.charged_mwh << ","
         << "st_discharged_mwh=" << m.schedule_tx_energy.discharged_mwh << ","
         << "total_charged_mwh=" << m.total_energy.charged_mwh << ","
         << "total_discharged_mwh=" << m.total_energy.discharged_mwh << ","
         << "pct_charged_via_st=" << m.energy_shares.pct_charged_via_st << ","
         << "pct_discharged_via_st=" << m.energy_shares.pct_discharged_via_st << ","
         << "final_soc_pct=" << res.final_soc_pct() << ","
         << "transactions=" << res.transactions.size() << "i";

    line << " " << timestamp_ns;

    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        ++failed_writes_;
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        ++failed_writes_;
        return false;
    }

    ++successful_writes_;
    if (successful_writes_ == 1) {
        LOG_INFO("[InfluxDB] First batch written");
    }
    return true;
}

// ============================================================================
// Time Conversion
// ============================================================================

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

int64_t InfluxClient::sim_time_to_ns(double sim_time_s) {
    return static_cast<int64_t>(sim_time_s * 1e9);
}

} // namespace utils
