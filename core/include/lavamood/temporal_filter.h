#pragma once

/**
 * @file temporal_filter.h
 * @brief Per-axis exponential smoothing with rate limiting
 *
 * Turns a possibly jumpy target emotion into a slowly evolving smoothed
 * emotion. Each axis has its own time constant (valence slowest, arousal
 * fastest). The requested step is clamped to maxStep before the exponential
 * blend, so neither a sudden target jump nor a single large dt can move the
 * state by more than maxStep per tick.
 *
 * @par Parameters
 * | Name | Default | Description |
 * |------|---------|-------------|
 * | tauValence | 2.0 | Valence time constant in seconds |
 * | tauArousal | 0.6 | Arousal time constant in seconds |
 * | tauDominance | 1.2 | Dominance time constant in seconds |
 * | maxStep | 0.25 | Largest per-tick step toward the target |
 */

#include <lavamood/vad.h>

namespace lavamood {

struct FilterSettings {
    float tauValence = 2.0f;
    float tauArousal = 0.6f;
    float tauDominance = 1.2f;
    float maxStep = 0.25f;

    float tau(int axis) const {
        return axis == 0 ? tauValence : (axis == 1 ? tauArousal : tauDominance);
    }
};

class TemporalFilter {
public:
    TemporalFilter() = default;
    explicit TemporalFilter(const FilterSettings& settings) : m_settings(settings) {}

    /**
     * @brief Advance the smoothed state toward target by dt seconds
     * @return The new smoothed state
     *
     * A non-positive dt leaves the state unchanged.
     */
    SmoothedEmotion update(const TargetEmotion& target, float dt);

    const SmoothedEmotion& state() const { return m_state; }
    const FilterSettings& settings() const { return m_settings; }

    /// @brief Return to the neutral state (0, 0, 0)
    void reset() { m_state = SmoothedEmotion(); }

private:
    FilterSettings m_settings;
    SmoothedEmotion m_state;
};

} // namespace lavamood
