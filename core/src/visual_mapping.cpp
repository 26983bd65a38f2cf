// lavamood - Visual Mapping Implementation
// Smoothed VAD + energy -> colors, blob count and physical coefficients

#include <lavamood/visual_mapping.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace lavamood {

namespace {

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

float wrapHue(float h) {
    h = std::fmod(h, 360.0f);
    if (h < 0.0f) h += 360.0f;
    return h >= 360.0f ? 0.0f : h;
}

} // namespace

VisualMapping::VisualMapping(const MappingSettings& settings, uint32_t seed)
    : m_settings(settings)
    , m_rng(seed) {
}

VisualParams VisualMapping::map(const SmoothedEmotion& vad, float energy, float elapsed) {
    const float nv = normalized(vad.valence);
    const float na = normalized(vad.arousal);
    const float nd = normalized(vad.dominance);

    // Color: cool -> warm with valence, richer and brighter with arousal
    float hue = lerp(220.0f, 20.0f, nv);
    float sat = 0.3f + 0.7f * na;
    float val = 0.4f + 0.6f * na;

    // Low dominance makes the secondary hue erratic
    std::uniform_real_distribution<float> jitter(-m_settings.hueJitter, m_settings.hueJitter);
    float hue2 = wrapHue(hue + jitter(m_rng) * (1.0f - nd));

    VisualParams p;
    p.hsvPrimary = glm::vec3(hue, sat, val);
    p.hsvSecondary = glm::vec3(hue2, sat, val);
    p.rgbPrimary = Color::fromHSV(p.hsvPrimary).clamped();
    p.rgbSecondary = Color::fromHSV(p.hsvSecondary).clamped();

    p.blobCount = std::max(3, 3 + static_cast<int>(std::floor(na * 10.0f)));
    p.blobSizeMean = lerp(0.14f, 0.05f, na);
    p.surfaceTension = lerp(0.2f, 1.0f, nd);
    p.viscosity = lerp(1.0f, 0.2f, nv);
    p.buoyancy = lerp(-0.3f, 0.3f, nv);
    p.turbulence = m_settings.baseTurbulence
                 + na * m_settings.arousalGain
                 + energy * m_settings.energyGain;
    p.threshold = lerp(1.2f, 0.9f, nd);

    // Slow side-to-side drift: faster with arousal, wider with energy
    float freq = 0.1f + na * 1.5f;
    float amp = 0.02f + energy * 0.05f;
    p.gravityX = std::sin(elapsed * freq * glm::two_pi<float>()) * amp;

    return p;
}

} // namespace lavamood
