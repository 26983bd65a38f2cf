// lavamood - Engine Implementation
// One tick: sample -> filter -> energy -> mapping -> simulation

#include <lavamood/engine.h>
#include <cmath>

namespace lavamood {

namespace {

const char* axisName(int axis) {
    switch (axis) {
        case 0: return "valence";
        case 1: return "arousal";
        default: return "dominance";
    }
}

} // namespace

EmotionLavaLampEngine::EmotionLavaLampEngine(VadSource source, const EngineConfig& config)
    : m_source(std::move(source))
    , m_config(config)
    , m_filter(config.filter)
    , m_energyModel(config.energy)
    , m_mapper(config.mapping, config.seed)
    , m_sim(config.simulation, config.seed + 1) {
}

void EmotionLavaLampEngine::pullSample() {
    if (!m_source) return;

    std::optional<Vad> sample = m_source();
    if (!sample) return;  // hold the previous target

    for (int axis = 0; axis < kAxisCount; ++axis) {
        if (std::isnan((*sample)[axis])) {
            throw VadSourceError("VAD source returned NaN for " + std::string(axisName(axis)) +
                                 " on frame " + std::to_string(m_frame));
        }
    }
    m_targetVad = TargetEmotion(*sample);
}

VisualParams EmotionLavaLampEngine::tick(float dt) {
    pullSample();

    const SmoothedEmotion smoothed = m_filter.update(m_targetVad, dt);
    const float energy = m_energyModel.update(m_targetVad, smoothed);

    m_time += dt;
    const float elapsed = static_cast<float>(m_time);

    const VisualParams params = m_mapper.map(smoothed, energy, elapsed);

    const float na = normalized(smoothed.arousal);
    const float nd = normalized(smoothed.dominance);
    m_sim.step(params, nd, na, dt, elapsed);

    m_lastParams = params;
    ++m_frame;
    return params;
}

EngineStatus EmotionLavaLampEngine::status() const {
    EngineStatus s;
    s.smoothed = m_filter.state();
    s.target = m_targetVad;
    s.energy = m_energyModel.energy();
    s.blobCount = m_sim.blobCount();
    s.turbulence = m_lastParams.turbulence;
    s.time = m_time;
    s.frame = m_frame;
    return s;
}

} // namespace lavamood
