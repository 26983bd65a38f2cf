// lavamood - Energy Model Implementation

#include <lavamood/energy_model.h>
#include <algorithm>
#include <cmath>

namespace lavamood {

float EmotionEnergyModel::divergence(const Vad& a, const Vad& b) {
    float sum = 0.0f;
    for (int axis = 0; axis < kAxisCount; ++axis) {
        sum += std::abs(a[axis] - b[axis]);
    }
    return sum / static_cast<float>(kAxisCount);
}

float EmotionEnergyModel::update(const TargetEmotion& target, const SmoothedEmotion& smoothed) {
    m_energy += divergence(target, smoothed);
    m_energy *= m_settings.decay;
    m_energy = std::clamp(m_energy, 0.0f, m_settings.maxEnergy);
    return m_energy;
}

} // namespace lavamood
