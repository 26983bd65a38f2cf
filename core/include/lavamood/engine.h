#pragma once

/**
 * @file engine.h
 * @brief Per-frame orchestration of the emotion lava lamp
 *
 * EmotionLavaLampEngine pulls one optional sample per tick and runs
 * filter -> energy -> mapping -> simulation in that order. The caller drives
 * tick() once per animation frame and renders blobs() with the returned
 * params. Everything is synchronous and single-threaded.
 *
 * @par Example
 * @code
 * EmotionLavaLampEngine engine([&]() { return sensor.poll(); });
 * while (running) {
 *     VisualParams p = engine.tick(1.0f / 60.0f);
 *     renderer.draw(p, engine.blobs());
 * }
 * @endcode
 */

#include <lavamood/config.h>
#include <lavamood/energy_model.h>
#include <lavamood/fluid_simulation.h>
#include <lavamood/status.h>
#include <lavamood/temporal_filter.h>
#include <lavamood/vad.h>
#include <lavamood/visual_mapping.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace lavamood {

/**
 * @brief Thrown when the sample source returns a malformed (NaN) value
 */
class VadSourceError : public std::runtime_error {
public:
    explicit VadSourceError(const std::string& what) : std::runtime_error(what) {}
};

class EmotionLavaLampEngine {
public:
    static constexpr float kDefaultDt = 0.016f;

    /**
     * @param source Sample source; an empty function never yields
     * @param config Tunables and generator seed
     */
    explicit EmotionLavaLampEngine(VadSource source, const EngineConfig& config = EngineConfig());

    /**
     * @brief Advance one frame
     * @return This frame's visual parameters
     * @throw VadSourceError if the source yields a NaN component
     */
    VisualParams tick(float dt = kDefaultDt);

    const TargetEmotion& targetVad() const { return m_targetVad; }
    const SmoothedEmotion& smoothed() const { return m_filter.state(); }
    float energy() const { return m_energyModel.energy(); }
    double time() const { return m_time; }
    uint64_t frameCount() const { return m_frame; }

    const std::vector<Blob>& blobs() const { return m_sim.blobs(); }
    const VisualParams& lastParams() const { return m_lastParams; }

    const TemporalFilter& filter() const { return m_filter; }
    const EmotionEnergyModel& energyModel() const { return m_energyModel; }
    const FluidSimulation& simulation() const { return m_sim; }
    const EngineConfig& config() const { return m_config; }

    /// @brief Snapshot for status readouts
    EngineStatus status() const;

private:
    void pullSample();

    VadSource m_source;
    EngineConfig m_config;

    TemporalFilter m_filter;
    EmotionEnergyModel m_energyModel;
    VisualMapping m_mapper;
    FluidSimulation m_sim;

    TargetEmotion m_targetVad;
    VisualParams m_lastParams;
    double m_time = 0.0;
    uint64_t m_frame = 0;
};

} // namespace lavamood
