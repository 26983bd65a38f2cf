// lavamood - Configuration
// JSON load/save and range validation for EngineConfig

#include <lavamood/config.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace lavamood {

using json = nlohmann::json;

std::string EngineConfig::validate() const {
    if (!(filter.tauValence > 0.0f)) return "filter.tauValence must be > 0";
    if (!(filter.tauArousal > 0.0f)) return "filter.tauArousal must be > 0";
    if (!(filter.tauDominance > 0.0f)) return "filter.tauDominance must be > 0";
    if (!(filter.maxStep > 0.0f)) return "filter.maxStep must be > 0";
    if (!(energy.decay > 0.0f && energy.decay <= 1.0f)) return "energy.decay must be in (0, 1]";
    if (!(energy.maxEnergy > 0.0f)) return "energy.maxEnergy must be > 0";
    if (!(mapping.hueJitter >= 0.0f)) return "mapping.hueJitter must be >= 0";
    if (!(simulation.width > 0.0f)) return "simulation.width must be > 0";
    if (!(simulation.height > 0.0f)) return "simulation.height must be > 0";
    if (!(simulation.dampingBase > 0.0f && simulation.dampingBase <= 1.0f)) {
        return "simulation.dampingBase must be in (0, 1]";
    }
    return "";
}

EngineConfig configFromJson(const json& j) {
    EngineConfig c;
    c.seed = j.value("seed", c.seed);

    if (j.contains("filter")) {
        const json& f = j.at("filter");
        c.filter.tauValence = f.value("tauValence", c.filter.tauValence);
        c.filter.tauArousal = f.value("tauArousal", c.filter.tauArousal);
        c.filter.tauDominance = f.value("tauDominance", c.filter.tauDominance);
        c.filter.maxStep = f.value("maxStep", c.filter.maxStep);
    }
    if (j.contains("energy")) {
        const json& e = j.at("energy");
        c.energy.decay = e.value("decay", c.energy.decay);
        c.energy.maxEnergy = e.value("maxEnergy", c.energy.maxEnergy);
    }
    if (j.contains("mapping")) {
        const json& m = j.at("mapping");
        c.mapping.baseTurbulence = m.value("baseTurbulence", c.mapping.baseTurbulence);
        c.mapping.arousalGain = m.value("arousalGain", c.mapping.arousalGain);
        c.mapping.energyGain = m.value("energyGain", c.mapping.energyGain);
        c.mapping.hueJitter = m.value("hueJitter", c.mapping.hueJitter);
    }
    if (j.contains("simulation")) {
        const json& s = j.at("simulation");
        c.simulation.width = s.value("width", c.simulation.width);
        c.simulation.height = s.value("height", c.simulation.height);
        c.simulation.dampingBase = s.value("dampingBase", c.simulation.dampingBase);
    }
    return c;
}

json configToJson(const EngineConfig& c) {
    return {
        {"seed", c.seed},
        {"filter", {
            {"tauValence", c.filter.tauValence},
            {"tauArousal", c.filter.tauArousal},
            {"tauDominance", c.filter.tauDominance},
            {"maxStep", c.filter.maxStep}
        }},
        {"energy", {
            {"decay", c.energy.decay},
            {"maxEnergy", c.energy.maxEnergy}
        }},
        {"mapping", {
            {"baseTurbulence", c.mapping.baseTurbulence},
            {"arousalGain", c.mapping.arousalGain},
            {"energyGain", c.mapping.energyGain},
            {"hueJitter", c.mapping.hueJitter}
        }},
        {"simulation", {
            {"width", c.simulation.width},
            {"height", c.simulation.height},
            {"dampingBase", c.simulation.dampingBase}
        }}
    };
}

bool loadConfig(const std::string& path, EngineConfig& config, std::string* error) {
    auto fail = [&](const std::string& msg) {
        std::cerr << "[lavamood] " << msg << "\n";
        if (error) *error = msg;
        return false;
    };

    if (!std::filesystem::exists(path)) {
        return fail("Config not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return fail("Failed to open: " + path);
    }

    EngineConfig loaded;
    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            return fail("Config root must be an object: " + path);
        }
        loaded = configFromJson(j);
    } catch (const json::parse_error& e) {
        return fail("Parse error in " + path + ": " + e.what());
    } catch (const json::exception& e) {
        return fail("Invalid config " + path + ": " + e.what());
    }

    std::string problem = loaded.validate();
    if (!problem.empty()) {
        return fail("Invalid config " + path + ": " + problem);
    }

    config = loaded;
    std::cerr << "[lavamood] Loaded config: " << path << "\n";
    return true;
}

bool saveConfig(const std::string& path, const EngineConfig& config) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[lavamood] Failed to write: " << path << "\n";
        return false;
    }

    try {
        file << std::setw(2) << configToJson(config) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[lavamood] Write error: " << e.what() << "\n";
        return false;
    }
}

} // namespace lavamood
