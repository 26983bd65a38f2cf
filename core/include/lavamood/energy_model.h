#pragma once

/**
 * @file energy_model.h
 * @brief Decaying volatility accumulator
 *
 * Energy grows with the mean absolute gap between the raw target and the
 * smoothed state and decays geometrically every tick. It only modulates
 * turbulence and the sideways drift; it is never fed back into the filter.
 */

#include <lavamood/vad.h>

namespace lavamood {

struct EnergySettings {
    float decay = 0.995f;       ///< Multiplier applied once per tick
    float maxEnergy = 10.0f;    ///< Upper clamp
};

class EmotionEnergyModel {
public:
    EmotionEnergyModel() = default;
    explicit EmotionEnergyModel(const EnergySettings& settings) : m_settings(settings) {}

    /// @brief Accumulate this tick's divergence, decay and clamp
    /// @return Energy in [0, maxEnergy]
    float update(const TargetEmotion& target, const SmoothedEmotion& smoothed);

    float energy() const { return m_energy; }
    const EnergySettings& settings() const { return m_settings; }
    void reset() { m_energy = 0.0f; }

    /// @brief Mean absolute per-axis difference between two triples
    static float divergence(const Vad& a, const Vad& b);

private:
    EnergySettings m_settings;
    float m_energy = 0.0f;
};

} // namespace lavamood
