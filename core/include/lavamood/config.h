#pragma once

/**
 * @file config.h
 * @brief Engine configuration and its JSON form
 *
 * All tunable constants of the pipeline in one place. Files are plain JSON;
 * missing keys keep their defaults and unknown keys are ignored.
 *
 * @par Example file
 * @code
 * {
 *   "seed": 7,
 *   "filter":     { "tauValence": 2.0, "tauArousal": 0.6, "tauDominance": 1.2, "maxStep": 0.25 },
 *   "energy":     { "decay": 0.995, "maxEnergy": 10.0 },
 *   "mapping":    { "baseTurbulence": 0.1, "arousalGain": 0.9, "energyGain": 0.4, "hueJitter": 24.0 },
 *   "simulation": { "width": 1.0, "height": 1.0, "dampingBase": 0.995 }
 * }
 * @endcode
 */

#include <lavamood/temporal_filter.h>
#include <lavamood/energy_model.h>
#include <lavamood/visual_mapping.h>
#include <lavamood/fluid_simulation.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace lavamood {

struct EngineConfig {
    FilterSettings filter;
    EnergySettings energy;
    MappingSettings mapping;
    SimulationSettings simulation;
    uint32_t seed = VisualMapping::kDefaultSeed;

    /**
     * @brief Check value ranges
     * @return Empty string if valid, otherwise a description of the first problem
     */
    std::string validate() const;
};

/// @brief Build a config from JSON, starting from defaults
/// @throw nlohmann::json::exception on type mismatch
EngineConfig configFromJson(const nlohmann::json& j);

nlohmann::json configToJson(const EngineConfig& config);

/**
 * @brief Load and validate a config file
 * @param path JSON file path
 * @param config Receives the loaded config (untouched on failure)
 * @param error Receives a description on failure (optional)
 * @return true on success
 */
bool loadConfig(const std::string& path, EngineConfig& config, std::string* error = nullptr);

/// @brief Write config as indented JSON
bool saveConfig(const std::string& path, const EngineConfig& config);

} // namespace lavamood
