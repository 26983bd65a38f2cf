#pragma once

/**
 * @file visual_mapping.h
 * @brief Smoothed emotion to lava-lamp parameters
 *
 * VisualMapping::map() is a closed-form function of (smoothed VAD, energy,
 * elapsed time). The only non-determinism is the secondary hue jitter, drawn
 * from a generator owned by the mapper and seeded at construction.
 *
 * @par Mapping rules (nv, na, nd = axis remapped to 0-1)
 * | Output | Formula |
 * |--------|---------|
 * | hue | lerp(220, 20, nv) degrees |
 * | saturation | 0.3 + 0.7 na |
 * | value | 0.4 + 0.6 na |
 * | blobCount | 3 + floor(10 na) |
 * | blobSizeMean | lerp(0.14, 0.05, na) |
 * | surfaceTension | lerp(0.2, 1.0, nd) |
 * | viscosity | lerp(1.0, 0.2, nv) |
 * | buoyancy | lerp(-0.3, 0.3, nv) |
 * | turbulence | base + na * arousalGain + energy * energyGain |
 * | threshold | lerp(1.2, 0.9, nd) |
 * | gravityX | sin(2 pi t (0.1 + 1.5 na)) * (0.02 + 0.05 energy) |
 */

#include <lavamood/vad.h>
#include <lavamood/color.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <random>

namespace lavamood {

/**
 * @brief Per-tick snapshot of visual parameters
 *
 * Produced fresh by VisualMapping::map() and read by both the simulation
 * and the renderer. Treat as immutable once returned.
 */
struct VisualParams {
    glm::vec3 hsvPrimary{0.0f};     ///< (hue degrees, saturation, value)
    glm::vec3 hsvSecondary{0.0f};   ///< Primary with hue jitter applied
    Color rgbPrimary;
    Color rgbSecondary;
    int blobCount = 0;
    float blobSizeMean = 0.0f;
    float surfaceTension = 0.0f;
    float viscosity = 0.0f;
    float buoyancy = 0.0f;
    float turbulence = 0.0f;
    float threshold = 0.0f;         ///< Split size-ratio shaping factor
    float gravityX = 0.0f;
};

struct MappingSettings {
    float baseTurbulence = 0.1f;
    float arousalGain = 0.9f;
    float energyGain = 0.4f;
    float hueJitter = 24.0f;        ///< Max secondary hue offset in degrees at nd = 0
};

class VisualMapping {
public:
    static constexpr uint32_t kDefaultSeed = 42;

    explicit VisualMapping(const MappingSettings& settings = MappingSettings(),
                           uint32_t seed = kDefaultSeed);

    /**
     * @brief Map a smoothed emotion to visual parameters
     * @param vad Smoothed emotion
     * @param energy Current volatility energy
     * @param elapsed Simulated time in seconds (drives the sideways drift)
     */
    VisualParams map(const SmoothedEmotion& vad, float energy, float elapsed);

    /// @brief Reseed the hue-jitter generator
    void seed(uint32_t s) { m_rng.seed(s); }

    const MappingSettings& settings() const { return m_settings; }

private:
    MappingSettings m_settings;
    std::mt19937 m_rng;
};

} // namespace lavamood
