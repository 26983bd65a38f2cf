// lavamood - Temporal Filter Implementation
// Rate-limited exponential smoothing, one time constant per axis

#include <lavamood/temporal_filter.h>
#include <algorithm>
#include <cmath>

namespace lavamood {

SmoothedEmotion TemporalFilter::update(const TargetEmotion& target, float dt) {
    if (dt <= 0.0f) return m_state;

    Vad next = m_state;
    for (int axis = 0; axis < kAxisCount; ++axis) {
        float current = m_state[axis];
        float alpha = 1.0f - std::exp(-dt / m_settings.tau(axis));

        float step = std::clamp(target[axis] - current, -m_settings.maxStep, m_settings.maxStep);
        float bounded = current + step;

        next[axis] = current + (bounded - current) * alpha;
    }

    m_state = SmoothedEmotion(next);  // clamps to [-1, 1]
    return m_state;
}

} // namespace lavamood
