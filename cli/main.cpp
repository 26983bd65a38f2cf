// lavamood - Entry Point
// Parses command-line arguments and runs the headless driver

#include "app.h"
#include <lavamood/lavamood.h>
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    CLI::App app{"lavamood - emotion-driven lava lamp simulation"};
    app.set_version_flag("-v,--version", std::string(lavamood::VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    lavamood::cli::AppConfig config;
    std::string mode = "sine";
    uint32_t seed = 0;

    app.add_option("-m,--mode", mode, "Built-in VAD signal: sine, noise, step, hold")
       ->check(CLI::IsMember({"sine", "noise", "step", "hold"}))
       ->default_val("sine");
    app.add_option("-f,--frames", config.frames, "Number of frames to simulate")
       ->check(CLI::NonNegativeNumber)
       ->default_val(300);
    app.add_option("--dt", config.dt, "Frame length in seconds")
       ->check(CLI::PositiveNumber)
       ->default_val(0.016f);
    auto* seedOpt = app.add_option("-s,--seed", seed, "Random seed (overrides config)");
    app.add_option("-c,--config", config.configPath, "JSON config file")
       ->check(CLI::ExistingFile);
    app.add_option("--save-config", config.saveConfigPath, "Write the effective config to a file");
    app.add_option("-e,--every", config.reportEvery, "Status line interval in frames")
       ->check(CLI::PositiveNumber)
       ->default_val(30);
    app.add_flag("--json", config.json, "Emit one JSON frame per line");
    app.add_flag("--blobs", config.includeBlobs, "Include blob lists in JSON frames");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // IsMember check guarantees a known mode
    config.mode = *lavamood::cli::parseSignalMode(mode);
    if (seedOpt->count() > 0) {
        config.seedOverride = true;
        config.seed = seed;
    }

    return lavamood::cli::run(config);
}
