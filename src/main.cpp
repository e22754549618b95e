// =============================================================================
// daqpath - NI-DAQmx resource path tool
// =============================================================================
// Main entry point for the daqpath command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, explain, version
// - Global options: verbose, quiet, log-level, log-file
// - Driver options: library path (also from DAQPATH_NIDAQMX_LIBRARY) and
//   initial error buffer size
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "daqpath/common/error.h"
#include "daqpath/common/logger.h"
#include "daqpath/driver/driver.h"

#include "commands/compress_command.h"
#include "commands/driver_commands.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "daqpath: compact notation for NI-DAQmx resource paths\n"
    "Groups device/channel names by prefix and collapses contiguous indices\n"
    "into ranges, e.g. Dev1/ai0,Dev1/ai1,Dev1/ai2 -> Dev1/ai0:2.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logLevel;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Command Options
// =============================================================================

struct CliCompressOptions {
    std::vector<std::string> paths;
    std::string input;
};

CliCompressOptions gCompressOpts;

struct CliDriverOptions {
    std::string library = std::string(daqpath::driver::kDefaultLibraryName);
    std::uint32_t errorBufferSize = daqpath::driver::kDefaultErrorBufferSize;
};

CliDriverOptions gDriverOpts;

std::int32_t gExplainCode = 0;

// =============================================================================
// Command Setup Functions
// =============================================================================

void addDriverOptions(CLI::App* command) {
    command->add_option("--library", gDriverOpts.library, "NI-DAQmx shared library")
        ->envname("DAQPATH_NIDAQMX_LIBRARY")
        ->capture_default_str();

    command->add_option("--error-buffer-size", gDriverOpts.errorBufferSize,
                        "Initial buffer size for driver error strings")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
}

void setupCompressCommand(CLI::App& app) {
    auto* compress = app.add_subcommand("compress", "Print the compact pattern for resource paths");
    compress->alias("c");

    compress->add_option("paths", gCompressOpts.paths,
                         "Resource paths (comma-separated lists allowed)");

    compress->add_option("-i,--input", gCompressOpts.input,
                         "File with one path per line (or '-' for stdin)")
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    compress->callback([]() {
        if (!gCompressOpts.paths.empty() && !gCompressOpts.input.empty()) {
            throw CLI::ValidationError("--input", "cannot be combined with positional paths");
        }
        if (gCompressOpts.paths.empty() && gCompressOpts.input.empty()) {
            gCompressOpts.input = "-";
        }
    });
}

void setupExplainCommand(CLI::App& app) {
    auto* explain = app.add_subcommand("explain", "Print the driver text for a status code");
    explain->alias("e");

    explain->add_option("code", gExplainCode, "Driver status code (e.g. -200279)")
        ->required();

    addDriverOptions(explain);
}

void setupVersionCommand(CLI::App& app) {
    auto* version = app.add_subcommand("version", "Print the installed NI-DAQmx version");
    addDriverOptions(version);
}

[[nodiscard]] daqpath::driver::DriverConfig makeDriverConfig() {
    daqpath::driver::DriverConfig config;
    config.libraryPath = gDriverOpts.library;
    config.errorBufferSize = gDriverOpts.errorBufferSize;
    return config;
}

}  // namespace

// =============================================================================
// Command Implementations
// =============================================================================

namespace daqpath::commands {

int runCompress() {
    CompressOptions opts;
    opts.paths = gCompressOpts.paths;
    opts.inputPath = gCompressOpts.input;

    CompressCommand cmd(std::move(opts));
    return cmd.execute(std::cout);
}

int runExplain() {
    ExplainCommand cmd(driver::Driver::load(makeDriverConfig()), gExplainCode);
    return cmd.execute(std::cout);
}

int runVersion() {
    VersionCommand cmd(driver::Driver::load(makeDriverConfig()));
    return cmd.execute(std::cout);
}

}  // namespace daqpath::commands

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v for debug, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    app.add_option("--log-level", gOptions.logLevel, "Log level (overrides -v and -q)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"},
                              CLI::ignore_case));

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupCompressCommand(app);
    setupExplainCommand(app);
    setupVersionCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        daqpath::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = daqpath::log::Level::kWarning;
        if (!gOptions.logLevel.empty()) {
            logConfig.level = daqpath::log::levelFromString(gOptions.logLevel);
        } else if (gOptions.quiet) {
            logConfig.level = daqpath::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logConfig.level = daqpath::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = daqpath::log::Level::kDebug;
        }
        daqpath::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("compress")) {
            exitCode = daqpath::commands::runCompress();
        } else if (app.got_subcommand("explain")) {
            exitCode = daqpath::commands::runExplain();
        } else if (app.got_subcommand("version")) {
            exitCode = daqpath::commands::runVersion();
        }
    } catch (const daqpath::DaqPathException& ex) {
        DAQPATH_LOG_ERROR("{}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        DAQPATH_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    daqpath::log::shutdown();
    return exitCode;
}
