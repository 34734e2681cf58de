#include "inspector.hpp"
#include "logger.hpp"
#include "utils/args.hpp"
#include "utils/printer.hpp"
#include <iostream>
#include <string>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <cstdio>
#include <unistd.h>

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    Logger log(std::cerr, LogLevel::INFO, isatty(fileno(stderr)) != 0);

    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::runtime_error& e) {
        log.error(e.what());
        std::cerr << usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }

    if (config.verbose) {
        log.setLevel(LogLevel::DEBUG);
        log.debug("Verbose mode enabled.");
    }

    Inspector inspector(log);
    auto start = std::chrono::steady_clock::now();

    // The output directory is only created for an existing input.
    std::error_code ec;
    if (fs::exists(config.inputFile, ec)) {
        fs::create_directories(config.outputDir, ec);
        if (ec) {
            log.error("Cannot create output directory " + config.outputDir + ": " + ec.message());
            return 1;
        }
    }
    InspectReport report = inspector.process(config.inputFile, config.outputDir, config.listOnly);

    if (report.success())
        printReport(report, std::cout);

    if (config.jsonOutput) {
        try {
            dumpJson(report, config.jsonFile);
        } catch (const std::runtime_error& e) {
            log.error(e.what());
        }
    }

    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    log.debug("Total elapsed time: " + std::to_string(elapsed) + "ms");

    return exitCode(report);
}
