// src/sim/sim_main.cpp
#include "sim/sim_app.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nFrequency sources (first one given wins):\n");
    printf("  --freq-csv PATH       Measured trace, columns time_s,frequency_hz\n");
    printf("  --lua PATH            Lua scenario defining frequency_at(t_s, fn_hz)\n");
    printf("  (default)             Synthetic Gauss-Markov trace around fn\n");
    printf("\nOptions:\n");
    printf("  --config PATH         BESS config YAML (default: built-in reference BESS)\n");
    printf("  --duration SEC        Synthetic/Lua trace length (default: 21600)\n");
    printf("  --sample-rate HZ      Synthetic/Lua sample rate (default: 1)\n");
    printf("  --seed N              Synthetic trace seed, N > 0 (default: 42)\n");
    printf("  --save-freq PATH      Write the simulated frequency trace to CSV\n");
    printf("  --use-of / --no-of    Force overfulfillment on/off\n");
    printf("  --use-du / --no-du    Force deadband utilization on/off\n");
    printf("  --out PATH            Results CSV (default: bess_out.csv)\n");
    printf("  --log-file PATH       Mirror log output to file\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off (default: info)\n");
    printf("  --influx              Export results to InfluxDB\n");
    printf("  --influx-url URL      InfluxDB URL (default: http://localhost:8086)\n");
    printf("  --influx-token TOKEN  InfluxDB API token\n");
    printf("  --influx-org ORG      InfluxDB organization (default: Grid)\n");
    printf("  --influx-bucket NAME  InfluxDB bucket (default: bess-pcr)\n");
    printf("  --influx-run TAG      Value of the run tag (default: default)\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # 6 h synthetic trace with the reference BESS:\n");
    printf("  %s\n\n", prog_name);
    printf("  # Measured data with overfulfillment and deadband utilization:\n");
    printf("  %s --config config/bess/default.yaml --freq-csv data/freq.csv --use-of --use-du\n\n", prog_name);
    printf("  # Scripted step event, one hour at 1 Hz:\n");
    printf("  %s --lua config/lua/frequency_step.lua --duration 3600\n\n", prog_name);
}

int main(int argc, char** argv) {
    sim::SimAppConfig cfg{};
    utils::LogLevel log_level = utils::LogLevel::Info;

    static struct option long_options[] = {
        {"config",        required_argument, 0, 'c'},
        {"freq-csv",      required_argument, 0, 'f'},
        {"lua",           required_argument, 0, 'l'},
        {"duration",      required_argument, 0, 'D'},
        {"sample-rate",   required_argument, 0, 'r'},
        {"seed",          required_argument, 0, 's'},
        {"save-freq",     required_argument, 0, 'S'},
        {"use-of",        no_argument,       0, 'o'},
        {"no-of",         no_argument,       0, 'O'},
        {"use-du",        no_argument,       0, 'u'},
        {"no-du",         no_argument,       0, 'U'},
        {"out",           required_argument, 0, 'w'},
        {"log-file",      required_argument, 0, 'L'},
        {"log-level",     required_argument, 0, 'v'},
        {"influx",        no_argument,       0, 'I'},
        {"influx-url",    required_argument, 0, 1001},
        {"influx-token",  required_argument, 0, 1002},
        {"influx-org",    required_argument, 0, 1003},
        {"influx-bucket", required_argument, 0, 1004},
        {"influx-run",    required_argument, 0, 1005},
        {"help",          no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                cfg.bess_config_path = optarg;
                break;
            case 'f':
                cfg.freq_csv_path = optarg;
                break;
            case 'l':
                cfg.lua_script_path = optarg;
                break;
            case 'D':
                cfg.synthetic.duration_s = std::atof(optarg);
                if (cfg.synthetic.duration_s <= 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'r':
                cfg.synthetic.sample_rate_hz = std::atof(optarg);
                if (cfg.synthetic.sample_rate_hz <= 0) {
                    fprintf(stderr, "Error: Invalid sample rate: %s\n", optarg);
                    return 1;
                }
                break;
            case 's':
                cfg.synthetic.seed = std::strtoull(optarg, nullptr, 10);
                if (cfg.synthetic.seed == 0) {
                    fprintf(stderr, "Error: Invalid seed (must be a positive integer): %s\n", optarg);
                    return 1;
                }
                break;
            case 'S':
                cfg.save_freq_path = optarg;
                break;
            case 'o':
                cfg.use_overfulfillment = true;
                break;
            case 'O':
                cfg.use_overfulfillment = false;
                break;
            case 'u':
                cfg.use_deadband_utilization = true;
                break;
            case 'U':
                cfg.use_deadband_utilization = false;
                break;
            case 'w':
                cfg.csv_log_path = optarg;
                break;
            case 'L':
                cfg.debug_log_path = optarg;
                cfg.enable_debug_log_file = true;
                break;
            case 'v':
                if (!utils::parse_level(optarg, log_level)) {
                    fprintf(stderr, "Error: Invalid log level: %s\n", optarg);
                    return 1;
                }
                break;
            case 'I':
                cfg.influx.enabled = true;
                break;
            case 1001:
                cfg.influx.url = optarg;
                break;
            case 1002:
                cfg.influx.token = optarg;
                break;
            case 1003:
                cfg.influx.org = optarg;
                break;
            case 1004:
                cfg.influx.bucket = optarg;
                break;
            case 1005:
                cfg.influx.run_tag = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Error: Unexpected argument: %s\n", argv[optind]);
        print_usage(argv[0]);
        return 1;
    }

    utils::set_level(log_level);

    if (!cfg.freq_csv_path.empty() && !cfg.lua_script_path.empty()) {
        LOG_WARN("Both --freq-csv and --lua given; using the CSV trace");
    }

    LOG_INFO("========================================");
    LOG_INFO("BESS Primary Control Reserve Simulation");
    LOG_INFO("========================================");

    sim::SimApp app(cfg);
    const int rc = app.run();
    utils::close_log_file();
    return rc;
}
