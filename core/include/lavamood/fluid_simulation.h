#pragma once

/**
 * @file fluid_simulation.h
 * @brief Procedural blob simulation for the lava lamp
 *
 * Owns a set of blobs in a [0, width) x [0, height] domain. Each step
 * reconciles the blob count, integrates motion through a curl-like sine
 * field, then merges touching blobs and splits oversized ones. This is a
 * procedural approximation, not a fluid solver.
 *
 * Horizontal position wraps; vertical position is clamped.
 *
 * @par Example
 * @code
 * FluidSimulation sim(SimulationSettings{}, 7);
 * sim.step(params, nd, na, 0.016f, t);
 * for (const Blob& b : sim.blobs()) draw(b.position, b.radius, b.color);
 * @endcode
 */

#include <lavamood/visual_mapping.h>
#include <lavamood/color.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace lavamood {

struct Blob {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float radius = 0.05f;
    Color color;
};

struct SimulationSettings {
    float width = 1.0f;
    float height = 1.0f;
    float dampingBase = 0.995f;
};

class FluidSimulation {
public:
    static constexpr uint32_t kDefaultSeed = 1337;

    /// Offset of a split child from its parent, on both axes
    static constexpr float kSplitOffset = 0.03f;
    /// Radius ratio to blobSizeMean above which a blob may split
    static constexpr float kSplitRatio = 1.8f;

    explicit FluidSimulation(const SimulationSettings& settings = SimulationSettings(),
                             uint32_t seed = kDefaultSeed);

    /**
     * @brief Advance one tick
     * @param params This tick's visual parameters
     * @param nd Normalized dominance (0-1), merge probability
     * @param na Normalized arousal (0-1), split probability
     * @param dt Tick length in seconds
     * @param elapsed Simulated time, drives the velocity field
     *
     * On return blobs().size() == max(0, params.blobCount).
     */
    void step(const VisualParams& params, float nd, float na, float dt, float elapsed);

    /// @brief Replace all blobs with a fresh random population
    void reset(const VisualParams& params);

    /// @brief Restore a blob set (snapshot restore, tools, tests)
    void setBlobs(std::vector<Blob> blobs) { m_blobs = std::move(blobs); }

    const std::vector<Blob>& blobs() const { return m_blobs; }
    int blobCount() const { return static_cast<int>(m_blobs.size()); }

    float width() const { return m_settings.width; }
    float height() const { return m_settings.height; }
    const SimulationSettings& settings() const { return m_settings; }

    void seed(uint32_t s) { m_rng.seed(s); }

    /// @brief Per-tick velocity multiplier for a given viscosity
    float dampingFor(float viscosity) const {
        return m_settings.dampingBase - (1.0f - viscosity) * 0.02f;
    }

    /// @brief Curl-like acceleration direction at (x, y) and time t
    static glm::vec2 fieldAt(float x, float y, float t);

private:
    Blob randomBlob(const VisualParams& params, bool randomVelocity);
    void reconcileCount(const VisualParams& params);
    void integrate(const VisualParams& params, float dt, float elapsed);
    void mergeBlobs(float nd);
    void splitBlobs(float na, const VisualParams& params);

    float wrapX(float x) const;
    float clampY(float y) const;
    float draw();

    SimulationSettings m_settings;
    std::mt19937 m_rng;
    std::vector<Blob> m_blobs;
};

} // namespace lavamood
