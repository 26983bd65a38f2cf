// lavamood - Fluid Simulation Implementation
// Blob kinematics, count reconciliation and merge/split topology

#include <lavamood/fluid_simulation.h>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace lavamood {

FluidSimulation::FluidSimulation(const SimulationSettings& settings, uint32_t seed)
    : m_settings(settings)
    , m_rng(seed) {
}

glm::vec2 FluidSimulation::fieldAt(float x, float y, float t) {
    float nx = std::sin(3.0f * y + 1.7f * t) * 0.5f + std::sin(7.0f * y - 0.6f * t) * 0.5f;
    float ny = std::cos(3.0f * x - 1.3f * t) * 0.5f + std::cos(5.0f * x + 0.8f * t) * 0.5f;
    return glm::vec2(nx, ny);
}

float FluidSimulation::draw() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return static_cast<float>(dist(m_rng));
}

float FluidSimulation::wrapX(float x) const {
    float w = m_settings.width;
    float wrapped = std::fmod(x, w);
    if (wrapped < 0.0f) wrapped += w;
    // -epsilon + w can round up to w
    return wrapped >= w ? 0.0f : wrapped;
}

float FluidSimulation::clampY(float y) const {
    return std::clamp(y, 0.0f, m_settings.height);
}

Blob FluidSimulation::randomBlob(const VisualParams& params, bool randomVelocity) {
    Blob b;
    // Separate statements keep the draw order fixed for a given seed
    float x = draw() * m_settings.width;
    float y = draw() * m_settings.height;
    b.position = glm::vec2(wrapX(x), clampY(y));
    if (randomVelocity) {
        std::uniform_real_distribution<float> vel(-0.05f, 0.05f);
        b.velocity.x = vel(m_rng);
        b.velocity.y = vel(m_rng);
        std::normal_distribution<float> size(params.blobSizeMean, 0.015f);
        b.radius = std::max(0.01f, size(m_rng));
    } else {
        b.velocity = glm::vec2(0.0f);
        b.radius = std::max(0.01f, params.blobSizeMean);
    }
    b.color = params.rgbPrimary;
    return b;
}

void FluidSimulation::reset(const VisualParams& params) {
    m_blobs.clear();
    int count = std::max(0, params.blobCount);
    m_blobs.reserve(count);
    for (int i = 0; i < count; ++i) {
        m_blobs.push_back(randomBlob(params, true));
    }
}

void FluidSimulation::reconcileCount(const VisualParams& params) {
    size_t target = static_cast<size_t>(std::max(0, params.blobCount));
    while (m_blobs.size() < target) {
        m_blobs.push_back(randomBlob(params, false));
    }
    if (m_blobs.size() > target) {
        m_blobs.resize(target);
    }
}

void FluidSimulation::integrate(const VisualParams& params, float dt, float elapsed) {
    const float damping = dampingFor(params.viscosity);
    const glm::vec2 bias(params.gravityX, params.buoyancy);

    for (Blob& b : m_blobs) {
        glm::vec2 field = fieldAt(b.position.x, b.position.y, elapsed);
        b.velocity += (field * params.turbulence + bias) * dt;
        b.velocity *= damping;

        glm::vec2 p = b.position + b.velocity * dt;
        b.position = glm::vec2(wrapX(p.x), clampY(p.y));
        b.color = params.rgbPrimary;
    }
}

void FluidSimulation::mergeBlobs(float nd) {
    const float reach = 1.5f - 0.5f * nd;

    for (size_t i = 0; i < m_blobs.size(); ++i) {
        size_t j = i + 1;
        while (j < m_blobs.size()) {
            Blob& a = m_blobs[i];
            const Blob& b = m_blobs[j];

            glm::vec2 d = a.position - b.position;
            float dist2 = glm::dot(d, d);
            float threshold = (a.radius + b.radius) * reach;

            if (dist2 < threshold * threshold && draw() < nd) {
                // Area-preserving combination
                a.radius = std::sqrt(a.radius * a.radius + b.radius * b.radius);
                a.velocity = (a.velocity + b.velocity) * 0.5f;
                m_blobs.erase(m_blobs.begin() + static_cast<std::ptrdiff_t>(j));
                continue;  // j now indexes the next candidate
            }
            ++j;
        }
    }
}

void FluidSimulation::splitBlobs(float na, const VisualParams& params) {
    const float limit = params.blobSizeMean * kSplitRatio;
    const size_t existing = m_blobs.size();

    for (size_t i = 0; i < existing; ++i) {
        if (m_blobs[i].radius <= limit || draw() >= na) continue;

        Blob& parent = m_blobs[i];
        parent.radius /= std::sqrt(2.0f);

        Blob child;
        child.position = glm::vec2(wrapX(parent.position.x + kSplitOffset),
                                   clampY(parent.position.y + kSplitOffset));
        child.velocity = glm::vec2(-parent.velocity.x, parent.velocity.y);
        child.radius = parent.radius;
        child.color = parent.color;

        // push_back may reallocate; parent is not used afterwards
        m_blobs.push_back(child);
    }
}

void FluidSimulation::step(const VisualParams& params, float nd, float na, float dt, float elapsed) {
    if (m_blobs.empty()) {
        reset(params);
    }
    reconcileCount(params);

    integrate(params, dt, elapsed);

    mergeBlobs(nd);
    splitBlobs(na, params);

    // Topology changes can leave the set off target
    reconcileCount(params);
}

} // namespace lavamood
