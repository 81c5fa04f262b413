#include "core/dicom_reader.hpp"
#include "core/logging.hpp"
#include "core/pipeline_config.hpp"
#include "services/export/report_serializer.hpp"
#include "services/qa/qa_pipeline.hpp"
#include "services/qa/report_assembler.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/format.h>

using namespace acr_qa;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitReportError = 1;
constexpr int kExitUsage = 2;

struct options {
    std::filesystem::path input;
    std::optional<std::filesystem::path> work_dir;
    std::optional<std::filesystem::path> plot_dir;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> config;
    bool verbose = false;
    bool quiet = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <archive.zip|directory> [options]\n"
              << "\n"
              << "Runs the ACR phantom QA checks on an MRI upload and prints the\n"
              << "report as JSON.\n"
              << "\n"
              << "Options:\n"
              << "  --work-dir <dir>     Extraction directory for ZIP uploads\n"
              << "  --plot-dir <dir>     Directory receiving the SVG plots\n"
              << "  --output, -o <file>  Write the report to a file instead of stdout\n"
              << "  --config, -c <file>  JSON configuration file\n"
              << "  --verbose, -v        Debug logging\n"
              << "  --quiet, -q          Errors only\n"
              << "  --help, -h           Show this help\n"
              << "\n"
              << "Exit codes: 0 report ok, 1 report error, 2 usage or configuration error\n";
}

bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--work-dir" && i + 1 < argc) {
            opts.work_dir = argv[++i];
        } else if (arg == "--plot-dir" && i + 1 < argc) {
            opts.plot_dir = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            opts.output = argv[++i];
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config = argv[++i];
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            std::cerr << "Error: Only one input may be given\n";
            return false;
        }
    }

    if (opts.input.empty()) {
        std::cerr << "Error: No input specified\n";
        return false;
    }

    if (opts.quiet) {
        opts.verbose = false;
    }

    return true;
}

std::optional<core::PipelineConfig> resolve_config(const options& opts) {
    core::PipelineConfig config;
    if (opts.config) {
        auto loaded = core::PipelineConfig::loadFromFile(*opts.config);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().toString() << "\n";
            return std::nullopt;
        }
        config = *loaded;
    }

    if (opts.work_dir) {
        config.workDirectory = *opts.work_dir;
    }
    if (opts.plot_dir) {
        config.plotDirectory = *opts.plot_dir;
    }
    if (opts.verbose) {
        config.logLevel = logging::LogLevel::Debug;
    } else if (opts.quiet) {
        config.logLevel = logging::LogLevel::Error;
    }
    return config;
}

services::Report run(const options& opts, const core::PipelineConfig& config) {
    services::EngineOptions engineOptions;
    engineOptions.plotUrlPrefix = config.plotUrlPrefix;

    services::QaPipeline pipeline(std::make_shared<core::GdcmDicomReader>(),
                                  config.plotDirectory, engineOptions);

    if (std::filesystem::is_directory(opts.input)) {
        return pipeline.runOnDirectory(opts.input);
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(opts.input, ec);
    if (ec) {
        return services::ReportAssembler::error(
            fmt::format("Cannot read upload {}: {}", opts.input.string(), ec.message()));
    }
    if (size > config.maxArchiveBytes) {
        return services::ReportAssembler::error(
            fmt::format("Upload is {} bytes; the limit is {} bytes.", size, config.maxArchiveBytes));
    }

    return pipeline.runOnUpload(opts.input, config.workDirectory);
}

} // anonymous namespace

/**
 * @brief Command-line entry point
 *
 * Loads the configuration, runs one QA job and emits its report.
 */
int main(int argc, char* argv[])
{
    options opts;
    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    if (!std::filesystem::exists(opts.input)) {
        std::cerr << "Error: Path does not exist: " << opts.input.string() << "\n";
        return kExitUsage;
    }

    auto config = resolve_config(opts);
    if (!config) {
        return kExitUsage;
    }

    logging::LoggerFactory::configure(config->toLogConfig());

    auto report = run(opts, *config);

    if (opts.output) {
        auto written = services::QaPipeline::writeReport(report, *opts.output);
        if (!written) {
            std::cerr << "Error: " << written.error().toString() << "\n";
            logging::LoggerFactory::shutdown();
            return kExitReportError;
        }
    } else {
        std::cout << services::ReportSerializer::toText(report) << "\n";
    }

    logging::LoggerFactory::shutdown();
    return report.isOk() ? kExitOk : kExitReportError;
}
