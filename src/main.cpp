#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "arbitrage_engine.hpp"
#include "batch.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "market_value.hpp"
#include "tax_engine.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_reader.hpp"
#include "io/parquet_writer.hpp"
#include "io/request_parser.hpp"
#include "io/text_report.hpp"

using importcalc::CalculationContext;
using importcalc::Logger;

namespace {

constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_USAGE = 1;        // Bad arguments or unreadable input files
constexpr int EXIT_CODE_CALCULATION = 2;  // InvalidInput, InsufficientData, DivisionUndefined
constexpr int EXIT_CODE_CONFIG = 3;       // Engine config or schedule tables rejected

struct CLIArgs {
    std::string command;
    // tax
    std::optional<double> co2;
    std::string fuel;
    std::string registered;
    std::string date;
    // analyze
    std::string request_path;
    std::string comparables_path;
    std::string format = "json";
    // batch
    std::string requests_path;
    std::string parquet_output_path;
    // common
    std::string config_path;
    std::string output_path;
    std::string log_level;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "ImportCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  tax                         Compute the registration tax (rest-BPM) for a vehicle\n";
    std::cerr << "  analyze                     Import margin analysis for one listing\n";
    std::cerr << "  batch                       Analyze many listings from one request file\n\n";
    std::cerr << "Tax options:\n";
    std::cerr << "  --co2 <g/km>                WLTP CO2 emission\n";
    std::cerr << "  --fuel <type>               petrol, diesel, electric, hybrid, gas (or a listing label)\n";
    std::cerr << "  --registered <YYYY-MM-DD>   First registration date\n";
    std::cerr << "  --date <YYYY-MM-DD>         Evaluation date (default: today)\n\n";
    std::cerr << "Analyze options:\n";
    std::cerr << "  --request <path>            JSON analysis request\n";
    std::cerr << "  --comparables <path>        CSV or Parquet comparables (replaces those in the request)\n";
    std::cerr << "  --format <json|text>        Output format (default: json)\n\n";
    std::cerr << "Batch options:\n";
    std::cerr << "  --requests <path>           JSON array of analysis requests\n";
    std::cerr << "  --parquet-output <path>     Also write one row per request to Parquet\n\n";
    std::cerr << "Common options:\n";
    std::cerr << "  --config <path>             Engine configuration JSON (default: built-in 2026 schedule)\n";
    std::cerr << "  --output <path>             Output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 usage or input error, 2 calculation error, 3 configuration error\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " tax --co2 118 --fuel diesel --registered 2022-03-15\n\n";
    std::cerr << "  " << program_name << " analyze --config data/engine_config.json \\\n";
    std::cerr << "      --request data/sample_request.json \\\n";
    std::cerr << "      --comparables data/sample_comparables.csv --format text\n\n";
    std::cerr << "  " << program_name << " batch --requests data/sample_batch.json \\\n";
    std::cerr << "      --output results.json --parquet-output results.parquet\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    int first_option = 1;
    if (argc > 1 && argv[1][0] != '-') {
        args.command = argv[1];
        first_option = 2;
    }

    for (int i = first_option; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--co2" && i + 1 < argc) {
            std::string value = argv[++i];
            size_t consumed = 0;
            try {
                args.co2 = std::stod(value, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed != value.size()) {
                std::cerr << "Error: --co2 expects a number, got '" << value << "'\n\n";
                return false;
            }
        } else if (arg == "--fuel" && i + 1 < argc) {
            args.fuel = argv[++i];
        } else if (arg == "--registered" && i + 1 < argc) {
            args.registered = argv[++i];
        } else if (arg == "--date" && i + 1 < argc) {
            args.date = argv[++i];
        } else if (arg == "--request" && i + 1 < argc) {
            args.request_path = argv[++i];
        } else if (arg == "--comparables" && i + 1 < argc) {
            args.comparables_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            args.format = argv[++i];
        } else if (arg == "--requests" && i + 1 < argc) {
            args.requests_path = argv[++i];
        } else if (arg == "--parquet-output" && i + 1 < argc) {
            args.parquet_output_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command.empty()) {
        std::cerr << "Error: A command is required (tax, analyze or batch)\n";
        return false;
    }

    if (args.command == "tax") {
        if (!args.co2) {
            std::cerr << "Error: --co2 is required\n";
            valid = false;
        }
        if (args.fuel.empty()) {
            std::cerr << "Error: --fuel is required\n";
            valid = false;
        }
        if (args.registered.empty()) {
            std::cerr << "Error: --registered is required\n";
            valid = false;
        }
    } else if (args.command == "analyze") {
        if (args.request_path.empty()) {
            std::cerr << "Error: --request is required\n";
            valid = false;
        } else if (!file_exists(args.request_path)) {
            std::cerr << "Error: Request file not found: " << args.request_path << "\n";
            valid = false;
        }
        if (!args.comparables_path.empty() && !file_exists(args.comparables_path)) {
            std::cerr << "Error: Comparables file not found: " << args.comparables_path << "\n";
            valid = false;
        }
    } else if (args.command == "batch") {
        if (args.requests_path.empty()) {
            std::cerr << "Error: --requests is required\n";
            valid = false;
        } else if (!file_exists(args.requests_path)) {
            std::cerr << "Error: Requests file not found: " << args.requests_path << "\n";
            valid = false;
        }
    } else {
        std::cerr << "Error: Unknown command: " << args.command << "\n";
        valid = false;
    }

    if (args.format != "json" && args.format != "text") {
        std::cerr << "Error: --format must be json or text\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    return valid;
}

// Helper function to check if string ends with suffix
bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

int report_failure(const CalculationContext& ctx, const std::exception& e, int exit_code) {
    Logger::get_instance().log_error(ctx, importcalc::error_kind_name(e), e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return exit_code;
}

// Writes to --output when given, stdout otherwise
template <typename Write>
void emit(const std::string& output_path, Write write) {
    if (output_path.empty()) {
        write(std::cout);
        std::cout.flush();
        return;
    }
    std::ofstream file(output_path);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + output_path);
    }
    write(file);
    std::cerr << "Output written to: " << output_path << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int run_tax_command(const CLIArgs& args, const importcalc::EngineConfig& config) {
    CalculationContext ctx("", "tax");

    importcalc::VehicleFacts vehicle;
    try {
        vehicle = importcalc::VehicleFacts(*args.co2,
                                           importcalc::parse_fuel_category(args.fuel),
                                           importcalc::CalendarDate::parse(args.registered));
        if (!args.date.empty()) {
            vehicle.evaluation_date = importcalc::CalendarDate::parse(args.date);
        }
    } catch (const importcalc::InvalidInput& e) {
        return report_failure(ctx, e, EXIT_CODE_USAGE);
    }

    importcalc::TaxResult result;
    try {
        result = importcalc::compute_tax_liability(vehicle, config.arbitrage.schedule);
    } catch (const importcalc::InvalidInput& e) {
        return report_failure(ctx, e, EXIT_CODE_CALCULATION);
    }
    Logger::get_instance().log_tax_computed(ctx, result);

    try {
        emit(args.output_path, [&](std::ostream& os) {
            if (args.format == "text") {
                importcalc::io::write_tax_report(os, vehicle, result);
            } else {
                importcalc::io::write_tax_result_json(os, vehicle, result);
            }
        });
    } catch (const std::exception& e) {
        return report_failure(ctx, e, EXIT_CODE_USAGE);
    }
    return EXIT_CODE_OK;
}

int run_analyze_command(const CLIArgs& args, const importcalc::EngineConfig& config) {
    CalculationContext ctx("", "analyze");

    importcalc::ArbitrageRequest request;
    try {
        request = importcalc::io::parse_request_from_file(args.request_path);
        ctx.request_id = request.id;

        if (!args.comparables_path.empty()) {
            if (ends_with(args.comparables_path, ".parquet")) {
                request.comparables = importcalc::ParquetReader::load_comparables(args.comparables_path);
            } else {
                request.comparables = importcalc::load_comparables_from_csv(args.comparables_path);
            }
        }
    } catch (const std::exception& e) {
        return report_failure(ctx, e, EXIT_CODE_USAGE);
    }

    importcalc::ArbitrageResult result;
    importcalc::MarketStats stats;
    try {
        auto start_time = std::chrono::high_resolution_clock::now();
        result = importcalc::compute_arbitrage(request, config.arbitrage);
        stats = importcalc::compute_market_stats(request.comparables);
        auto end_time = std::chrono::high_resolution_clock::now();

        Logger::get_instance().log_analysis_complete(
            ctx, result, std::chrono::duration<double, std::milli>(end_time - start_time).count());
    } catch (const importcalc::InvalidInput& e) {
        return report_failure(ctx, e, EXIT_CODE_CALCULATION);
    } catch (const importcalc::InsufficientData& e) {
        return report_failure(ctx, e, EXIT_CODE_CALCULATION);
    } catch (const importcalc::DivisionUndefined& e) {
        return report_failure(ctx, e, EXIT_CODE_CALCULATION);
    }

    try {
        emit(args.output_path, [&](std::ostream& os) {
            if (args.format == "text") {
                importcalc::io::write_analysis_report(os, result, stats);
            } else {
                importcalc::io::write_analysis_json(os, request.id, result, stats);
            }
        });
    } catch (const std::exception& e) {
        return report_failure(ctx, e, EXIT_CODE_USAGE);
    }
    return EXIT_CODE_OK;
}

int run_batch_command(const CLIArgs& args, const importcalc::EngineConfig& config) {
    CalculationContext ctx("", "batch");

    std::vector<importcalc::ArbitrageRequest> requests;
    try {
        requests = importcalc::io::parse_batch_from_file(args.requests_path);
    } catch (const std::exception& e) {
        return report_failure(ctx, e, EXIT_CODE_USAGE);
    }

    std::cerr << "Running batch of " << requests.size() << " requests...\n";
    importcalc::BatchResult batch = importcalc::run_batch(requests, config.arbitrage);

    std::cerr << "\nResults:\n";
    std::cerr << "  Succeeded: " << batch.succeeded << "\n";
    std::cerr << "  Failed:    " << batch.failed << "\n";
    std::cerr << "  GO:        " << batch.go_count << "\n";
    std::cerr << "  CONSIDER:  " << batch.consider_count << "\n";
    std::cerr << "  NO_GO:     " << batch.no_go_count << "\n";
    std::cerr << "  Execution: " << batch.execution_time_ms << " ms\n";

    try {
        emit(args.output_path, [&](std::ostream& os) {
            importcalc::io::write_batch_result_json(os, batch);
        });
        if (!args.parquet_output_path.empty()) {
            importcalc::ParquetWriter::write_batch_results(batch, args.parquet_output_path);
            std::cerr << "Parquet output written to: " << args.parquet_output_path << "\n";
        }
    } catch (const std::exception& e) {
        return report_failure(ctx, e, EXIT_CODE_USAGE);
    }
    return EXIT_CODE_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        std::cerr << "Use --help for usage information.\n";
        return EXIT_CODE_USAGE;
    }

    if (args.help) {
        print_usage(argv[0]);
        return EXIT_CODE_OK;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return EXIT_CODE_USAGE;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_CODE_USAGE;
    }

    importcalc::EngineConfig config;
    if (!args.config_path.empty()) {
        try {
            config = importcalc::parse_engine_config_from_file(args.config_path);
        } catch (const importcalc::ConfigParseError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return EXIT_CODE_CONFIG;
        } catch (const importcalc::ScheduleError& e) {
            std::cerr << "Error: Invalid tax schedule: " << e.what() << "\n";
            return EXIT_CODE_CONFIG;
        }
    }

    if (!args.log_level.empty()) {
        config.logging.min_level = importcalc::string_to_level(args.log_level);
    }
    Logger& logger = Logger::get_instance();
    logger.configure(config.logging);
    logger.log_config_loaded(config.source, config.arbitrage);

    int exit_code = EXIT_CODE_USAGE;
    if (args.command == "tax") {
        exit_code = run_tax_command(args, config);
    } else if (args.command == "analyze") {
        exit_code = run_analyze_command(args, config);
    } else if (args.command == "batch") {
        exit_code = run_batch_command(args, config);
    }

    logger.flush();
    return exit_code;
}
