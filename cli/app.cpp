// lavamood Application
// Headless frame loop with text or JSON-lines output

#include "app.h"
#include <lavamood/engine.h>
#include <iostream>

namespace lavamood::cli {

int run(const AppConfig& app) {
    EngineConfig config;
    if (!app.configPath.empty()) {
        std::string error;
        if (!loadConfig(app.configPath, config, &error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }
    if (app.seedOverride) {
        config.seed = app.seed;
    }

    if (!app.saveConfigPath.empty()) {
        if (!saveConfig(app.saveConfigPath, config)) {
            return 1;
        }
        std::cerr << "[lavamood] Wrote config: " << app.saveConfigPath << "\n";
    }

    VadSignal signal(app.mode, app.dt, config.seed);
    EmotionLavaLampEngine engine([&signal]() { return signal(); }, config);

    if (!app.json) {
        std::cout << "[lavamood] Running " << app.frames << " frames, signal="
                  << signalModeName(app.mode) << ", dt=" << app.dt << "\n";
    }

    const int every = app.reportEvery > 0 ? app.reportEvery : 1;
    try {
        for (int i = 0; i < app.frames; ++i) {
            VisualParams params = engine.tick(app.dt);

            if (app.json) {
                std::cout << frameToJson(engine.status(), params, engine.blobs(), app.includeBlobs).dump()
                          << "\n";
            } else if ((i + 1) % every == 0 || i + 1 == app.frames) {
                std::cout << formatStatus(engine.status()) << "\n";
            }
        }
    } catch (const VadSourceError& e) {
        std::cerr << "[lavamood] " << e.what() << "\n";
        return 1;
    }

    std::cout.flush();
    return 0;
}

} // namespace lavamood::cli
