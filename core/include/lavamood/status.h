#pragma once

/**
 * @file status.h
 * @brief Status telemetry and frame export
 *
 * Text and JSON encodings of the engine state for readouts and for
 * renderers running out of process.
 */

#include <lavamood/fluid_simulation.h>
#include <lavamood/vad.h>
#include <lavamood/visual_mapping.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace lavamood {

struct EngineStatus {
    SmoothedEmotion smoothed;
    TargetEmotion target;
    float energy = 0.0f;
    int blobCount = 0;
    float turbulence = 0.0f;
    double time = 0.0;
    uint64_t frame = 0;
};

/// @brief One-line readout, e.g. "Smoothed VAD: V=+0.12, A=-0.40, D=+0.05   Energy=0.213   Blobs=5   Turb=0.57"
std::string formatStatus(const EngineStatus& status);

nlohmann::json statusToJson(const EngineStatus& status);

nlohmann::json paramsToJson(const VisualParams& params);

/**
 * @brief Encode a full frame
 * @param includeBlobs Add the blob list (position, radius, "#rrggbb" color)
 */
nlohmann::json frameToJson(const EngineStatus& status, const VisualParams& params,
                           const std::vector<Blob>& blobs, bool includeBlobs);

} // namespace lavamood
