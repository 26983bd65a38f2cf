// lavamood - Built-in VAD test signals

#include "vad_signal.h"
#include <cmath>

namespace lavamood::cli {

std::optional<SignalMode> parseSignalMode(const std::string& name) {
    if (name == "sine") return SignalMode::Sine;
    if (name == "noise") return SignalMode::Noise;
    if (name == "step") return SignalMode::Step;
    if (name == "hold") return SignalMode::Hold;
    return std::nullopt;
}

const char* signalModeName(SignalMode mode) {
    switch (mode) {
        case SignalMode::Sine:  return "sine";
        case SignalMode::Noise: return "noise";
        case SignalMode::Step:  return "step";
        case SignalMode::Hold:  return "hold";
        default:                return "unknown";
    }
}

VadSignal::VadSignal(SignalMode mode, float dt, uint32_t seed)
    : m_mode(mode)
    , m_dt(dt)
    , m_rng(seed) {
}

std::optional<Vad> VadSignal::operator()() {
    m_time += m_dt;
    const float t = m_time;

    switch (m_mode) {
        case SignalMode::Sine:
            return clampVad(Vad(std::sin(t * 0.5f),
                                std::sin(t * 1.4f),
                                std::sin(t * 0.8f + 1.2f)));

        case SignalMode::Noise: {
            auto noise = [this](float range) {
                std::uniform_real_distribution<float> dist(-range, range);
                return dist(m_rng);
            };
            float v = std::sin(t * 0.25f) * 0.5f + noise(0.5f);
            float a = std::sin(t * 0.9f) * 0.4f + noise(0.6f);
            float d = std::sin(t * 0.45f + 1.0f) * 0.3f + noise(0.4f);
            return clampVad(Vad(v, a, d));
        }

        case SignalMode::Step:
            if (t > m_nextFlip) {
                m_nextFlip += 1.5f;
                m_stepState = Vad(-m_stepState.valence, -m_stepState.arousal, -m_stepState.dominance);
            }
            return m_stepState;

        case SignalMode::Hold:
            if (m_held) return std::nullopt;
            m_held = true;
            return Vad(0.8f, -0.6f, 0.4f);
    }
    return std::nullopt;
}

} // namespace lavamood::cli
