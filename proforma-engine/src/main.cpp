#include <iostream>
#include <fstream>
#include <string>
#include "errors.hpp"
#include "logger.hpp"
#include "model.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/scenario_reader.hpp"

namespace {

struct CLIArgs {
    std::string scenario_path;
    std::string rent_roll_path;
    std::string rate_curve_path;
    std::string output_path;
    std::string parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool resolve_circular = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Pro-Forma Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --scenario <json> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --scenario <path>           JSON scenario payload (required)\n";
    std::cerr << "  --rent-roll <path>          CSV rent roll (overrides the payload's tenants)\n";
    std::cerr << "  --rate-curve <path>         CSV index curve date,rate (overrides the payload's curve)\n\n";
    std::cerr << "Calculation options:\n";
    std::cerr << "  --resolve-circular          Solve the management-fee reimbursement fixed point\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Monthly table as Parquet (needs Apache Arrow)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log events to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 bad arguments or failed calculation, 2 invariant violation\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --scenario data/benchmark_scenario.json \\\n";
    std::cerr << "      --rent-roll data/benchmark_rent_roll.csv --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario_path = argv[++i];
        } else if (arg == "--rent-roll" && i + 1 < argc) {
            args.rent_roll_path = argv[++i];
        } else if (arg == "--rate-curve" && i + 1 < argc) {
            args.rate_curve_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--resolve-circular") {
            args.resolve_circular = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n";
        valid = false;
    } else if (!file_exists(args.scenario_path)) {
        std::cerr << "Error: Scenario file not found: " << args.scenario_path << "\n";
        valid = false;
    }

    if (!args.rent_roll_path.empty() && !file_exists(args.rent_roll_path)) {
        std::cerr << "Error: Rent roll file not found: " << args.rent_roll_path << "\n";
        valid = false;
    }
    if (!args.rate_curve_path.empty() && !file_exists(args.rate_curve_path)) {
        std::cerr << "Error: Rate curve file not found: " << args.rate_curve_path << "\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (!args.parquet_path.empty() && !proforma::io::ParquetWriter::available()) {
        std::cerr << "Error: --parquet requires a build with Apache Arrow\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    proforma::LoggerConfig log_config;
    log_config.min_level = proforma::string_to_level(args.log_level);
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    proforma::Logger::get_instance().configure(log_config);

    std::cerr << "Pro-Forma Engine v1.0.0\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  Scenario:    " << args.scenario_path << "\n";
    if (!args.rent_roll_path.empty()) {
        std::cerr << "  Rent roll:   " << args.rent_roll_path << "\n";
    }
    if (!args.rate_curve_path.empty()) {
        std::cerr << "  Rate curve:  " << args.rate_curve_path << "\n";
    }
    std::cerr << "\n";

    proforma::io::ScenarioDocument doc;
    try {
        std::cerr << "Loading scenario from " << args.scenario_path << "..." << std::flush;
        doc = proforma::io::parse_scenario_from_file(args.scenario_path);
        if (!args.rent_roll_path.empty()) {
            doc.inputs.tenants = proforma::TenantSet::load_from_csv(args.rent_roll_path);
        }
        if (!args.rate_curve_path.empty()) {
            doc.inputs.rate_curve = proforma::RateCurve::load_from_csv(args.rate_curve_path);
        }
        if (args.resolve_circular) {
            doc.config.resolve_circular = true;
        }
        std::cerr << " loaded " << doc.inputs.tenants.size() << " tenants, "
                  << doc.inputs.loans.size() << " loans\n";
    } catch (const proforma::ValidationError& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Running " << doc.inputs.scenario.hold_months << "-month pro forma...\n";

    proforma::CalculationResponse response;
    try {
        response = proforma::run_calculation(doc.inputs, doc.config);
    } catch (const proforma::InvariantViolation& e) {
        std::cerr << "Fatal: invariant violation: " << e.what() << "\n";
        return 2;
    }

    if (!response.success) {
        std::cerr << "Error (" << response.error_kind << "): " << response.error_message << "\n";
        proforma::io::write_error_json(std::cout, response);
        return 1;
    }

    const proforma::ModelResult& result = *response.result;
    const proforma::ReturnsSummary& r = result.returns;

    std::cerr << "\nResults:\n";
    std::cerr << "  Month-1 NOI:     " << r.month1_noi << "\n";
    std::cerr << "  Exit NOI:        " << r.exit_noi << "\n";
    std::cerr << "  Exit proceeds:   " << result.exit.net_proceeds << "\n";
    std::cerr << "  Unlevered IRR:   " << r.unlevered_irr * 100.0 << "%\n";
    std::cerr << "  Levered IRR:     " << r.levered_irr * 100.0 << "%\n";
    std::cerr << "  Equity multiple: " << r.levered_multiple << "x\n";
    for (const auto& w : response.warnings) {
        std::cerr << "  Warning: " << w << "\n";
    }

    try {
        if (args.output_path.empty()) {
            proforma::io::write_model_result_json(std::cout, result);
        } else {
            proforma::io::write_model_result_json(args.output_path, result);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        if (!args.parquet_path.empty()) {
            proforma::io::ParquetWriter::write_monthly(result.cash_flows, args.parquet_path);
            std::cerr << "Monthly table written to: " << args.parquet_path << "\n";
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
