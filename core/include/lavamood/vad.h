#pragma once

/**
 * @file vad.h
 * @brief Valence/Arousal/Dominance value types and the sample source contract
 *
 * A raw sample (Vad) comes from an external source and may lie outside
 * [-1, 1]. Inside the pipeline the same triple plays two roles, the clamped
 * target and the filtered state, which are kept apart as TargetEmotion and
 * SmoothedEmotion.
 *
 * @par Example
 * @code
 * VadSource source = []() -> std::optional<Vad> { return Vad{0.8f, -0.2f, 0.1f}; };
 * TargetEmotion target(*source());
 * @endcode
 */

#include <algorithm>
#include <functional>
#include <optional>

namespace lavamood {

/// @brief Axis indices for Vad::operator[]
enum class Axis : int {
    Valence = 0,
    Arousal = 1,
    Dominance = 2
};

constexpr int kAxisCount = 3;

/**
 * @brief Plain VAD triple as delivered by a source
 */
struct Vad {
    float valence = 0.0f;
    float arousal = 0.0f;
    float dominance = 0.0f;

    constexpr Vad() = default;
    constexpr Vad(float v, float a, float d) : valence(v), arousal(a), dominance(d) {}

    float operator[](int axis) const {
        return axis == 0 ? valence : (axis == 1 ? arousal : dominance);
    }
    float& operator[](int axis) {
        return axis == 0 ? valence : (axis == 1 ? arousal : dominance);
    }
    float operator[](Axis axis) const { return (*this)[static_cast<int>(axis)]; }

    bool operator==(const Vad& o) const {
        return valence == o.valence && arousal == o.arousal && dominance == o.dominance;
    }
    bool operator!=(const Vad& o) const { return !(*this == o); }
};

/// @brief Clamp every axis into [-1, 1]
inline Vad clampVad(const Vad& v) {
    return Vad(std::clamp(v.valence, -1.0f, 1.0f),
               std::clamp(v.arousal, -1.0f, 1.0f),
               std::clamp(v.dominance, -1.0f, 1.0f));
}

/// @brief Map an axis value from [-1, 1] to [0, 1]
inline float normalized(float axisValue) {
    return (axisValue + 1.0f) * 0.5f;
}

/**
 * @brief Clamped target emotion (last known good sample)
 *
 * Construction from a raw Vad always clamps.
 */
struct TargetEmotion : Vad {
    TargetEmotion() = default;
    explicit TargetEmotion(const Vad& raw) : Vad(clampVad(raw)) {}
    TargetEmotion(float v, float a, float d) : TargetEmotion(Vad(v, a, d)) {}
};

/**
 * @brief Output of the temporal filter
 */
struct SmoothedEmotion : Vad {
    SmoothedEmotion() = default;
    explicit SmoothedEmotion(const Vad& v) : Vad(clampVad(v)) {}
    SmoothedEmotion(float v, float a, float d) : SmoothedEmotion(Vad(v, a, d)) {}
};

/**
 * @brief Sample source invoked once per tick
 *
 * Returns std::nullopt when no new data is available. Must not block.
 */
using VadSource = std::function<std::optional<Vad>()>;

} // namespace lavamood
