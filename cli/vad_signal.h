// lavamood - Built-in VAD test signals
// Synthetic sources for driving the engine without a sensor

#pragma once

#include <lavamood/vad.h>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace lavamood::cli {

enum class SignalMode {
    Sine,   // Three slow sines at different rates
    Noise,  // Slow sines plus uniform noise
    Step,   // Square wave flipping sign every 1.5 s
    Hold    // One sample, then silence
};

/// @brief Parse "sine", "noise", "step" or "hold"
std::optional<SignalMode> parseSignalMode(const std::string& name);
const char* signalModeName(SignalMode mode);

/**
 * @brief Callable VAD source with its own clock
 *
 * Each call advances the internal clock by dt, independent of the engine.
 */
class VadSignal {
public:
    explicit VadSignal(SignalMode mode, float dt = 0.016f, uint32_t seed = 0);

    std::optional<Vad> operator()();

    float time() const { return m_time; }

private:
    SignalMode m_mode;
    float m_dt;
    float m_time = 0.0f;
    Vad m_stepState{-0.8f, -0.6f, -0.6f};
    float m_nextFlip = 1.5f;
    bool m_held = false;
    std::mt19937 m_rng;
};

} // namespace lavamood::cli
