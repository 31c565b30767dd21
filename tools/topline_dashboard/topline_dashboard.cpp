//
// Topline Dashboard
// Reads one mode partition of the topline summary and writes the legacy
// topline-{mode}.csv dashboard file
//

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <sstream>
#include <vector>

#include <arrow/compute/initialize.h>
#include <spdlog/spdlog.h>

#include <topline/core/constants.h>
#include <topline/core/report_config.h>
#include <topline/data/dashboard_writer.h>
#include <topline/data/storage.h>
#include <topline/data/summary_reader.h>
#include <topline/transforms/runtime/reformat_pipeline.h>

namespace {

constexpr int kUsageError = 2;

struct DashboardArgs {
    epoch_core::ReportMode mode = epoch_core::ReportMode::weekly;
    std::string bucket;
    std::string prefix;
    std::string input_bucket = topline::DEFAULT_INPUT_BUCKET;
    std::string input_prefix = topline::DEFAULT_INPUT_PREFIX;
    std::optional<std::string> config_file;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " MODE BUCKET PREFIX [options]\n"
              << "Arguments:\n"
              << "  MODE                    Report mode: weekly or monthly\n"
              << "  BUCKET                  Output bucket (or a file:// directory)\n"
              << "  PREFIX                  Output prefix; writes PREFIX/topline-MODE.csv\n"
              << "Options:\n"
              << "  --input_bucket BUCKET   Summary bucket (default: " << topline::DEFAULT_INPUT_BUCKET << ")\n"
              << "  --input_prefix PREFIX   Summary prefix (default: " << topline::DEFAULT_INPUT_PREFIX << ")\n"
              << "  --config FILE           YAML file overriding the report tables\n"
              << "  --log_level LEVEL       trace, debug, info, warn, error, critical or off (default: info)\n"
              << "  --help                  Show this help\n";
}

[[noreturn]] void UsageError(const char* prog_name, std::string const& message) {
    std::cerr << message << "\n";
    PrintUsage(prog_name);
    std::exit(kUsageError);
}

std::optional<epoch_core::ReportMode> ParseMode(std::string const& value) {
    for (auto mode : {epoch_core::ReportMode::weekly, epoch_core::ReportMode::monthly}) {
        if (epoch_core::ReportModeWrapper::ToString(mode) == value) {
            return mode;
        }
    }
    return std::nullopt;
}

DashboardArgs ParseArgs(int argc, char* argv[]) {
    DashboardArgs args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--input_bucket" && i + 1 < argc) {
            args.input_bucket = argv[++i];
        } else if (arg == "--input_prefix" && i + 1 < argc) {
            args.input_prefix = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (arg == "--log_level" && i + 1 < argc) {
            std::string level = argv[++i];
            args.log_level = spdlog::level::from_str(level);
            // from_str maps unknown names to off
            if (args.log_level == spdlog::level::off && level != "off") {
                UsageError(argv[0], "Unknown log level: " + level);
            }
        } else if (arg.starts_with("--")) {
            UsageError(argv[0], "Unknown argument: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        UsageError(argv[0], "Expected MODE BUCKET PREFIX");
    }
    auto mode = ParseMode(positional[0]);
    if (!mode) {
        UsageError(argv[0], "Invalid mode '" + positional[0] + "', expected weekly or monthly");
    }
    args.mode = *mode;
    args.bucket = positional[1];
    args.prefix = positional[2];
    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = ParseArgs(argc, argv);
    spdlog::set_level(args.log_level);

    try {
        // Initialize Arrow compute subsystem
        auto arrowComputeStatus = arrow::compute::Initialize();
        if (!arrowComputeStatus.ok()) {
            std::stringstream errorMsg;
            errorMsg << "arrow compute initialized failed: " << arrowComputeStatus;
            throw std::runtime_error(errorMsg.str());
        }

        const auto modeName = epoch_core::ReportModeWrapper::ToString(args.mode);
        SPDLOG_INFO("Generating {} topline_dashboard", modeName);

        const auto reportConfig = args.config_file
                                      ? topline::LoadReportConfigFile(*args.config_file)
                                      : topline::DefaultReportConfig();
        SPDLOG_DEBUG("Report configuration:\n{}", reportConfig.ToString());

        const auto inputUri = topline::data::SummaryLocation(args.input_bucket, args.input_prefix, args.mode);
        SPDLOG_INFO("Reading summary from {}", inputUri);
        const topline::data::SummaryReader reader{reportConfig.input_schema};
        auto summary = reader.Read(inputUri);

        auto report = topline::transform::ReformatData(summary, reportConfig);
        SPDLOG_INFO("Reformatted {} summary rows into {} dashboard rows",
                    summary.num_rows(), report.num_rows());

        const auto key = topline::data::DashboardKey(args.prefix, args.mode);
        topline::data::WriteDashboard(report, args.bucket, key);
        SPDLOG_INFO("Dashboard written to {}", topline::data::FormatStorageUri(args.bucket, key));
    } catch (const std::exception& e) {
        SPDLOG_ERROR("topline_dashboard failed: {}", e.what());
        return 1;
    }

    return 0;
}
