// lavamood Application
// Headless driver: ticks the engine from a built-in signal and reports status

#pragma once

#include "vad_signal.h"
#include <lavamood/config.h>
#include <cstdint>
#include <string>

namespace lavamood::cli {

// Configuration passed from command-line arguments
struct AppConfig {
    SignalMode mode = SignalMode::Sine;
    int frames = 300;
    float dt = 0.016f;
    int reportEvery = 30;       // status line interval (text mode)
    bool json = false;          // one JSON frame per line
    bool includeBlobs = false;  // add blob lists to JSON frames
    std::string configPath;
    std::string saveConfigPath;
    bool seedOverride = false;
    uint32_t seed = 0;
};

// Runs the engine for config.frames ticks
// Returns exit code (0 = success)
int run(const AppConfig& config);

} // namespace lavamood::cli
