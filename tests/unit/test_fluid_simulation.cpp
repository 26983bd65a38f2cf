/**
 * @file test_fluid_simulation.cpp
 * @brief Unit tests for FluidSimulation
 *
 * Merge and split are probabilistic with probabilities nd and na. Tests pin
 * them with nd, na in {0, 1} (a uniform draw in [0, 1) is always < 1 and
 * never < 0) and with fixed seeds for reproducibility.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lavamood/fluid_simulation.h>
#include <lavamood/visual_mapping.h>
#include <cmath>

using namespace lavamood;
using Catch::Matchers::WithinAbs;

namespace {

VisualParams makeParams(int count, float sizeMean = 0.1f) {
    VisualParams p;
    p.blobCount = count;
    p.blobSizeMean = sizeMean;
    p.viscosity = 0.6f;
    p.turbulence = 0.5f;
    p.buoyancy = 0.1f;
    p.gravityX = 0.01f;
    p.rgbPrimary = Color(0.9f, 0.4f, 0.1f);
    return p;
}

Blob makeBlob(float x, float y, float r, float vx = 0.0f, float vy = 0.0f) {
    Blob b;
    b.position = {x, y};
    b.velocity = {vx, vy};
    b.radius = r;
    return b;
}

} // namespace

TEST_CASE("FluidSimulation initialization", "[simulation]") {
    FluidSimulation sim(SimulationSettings(), 3);
    VisualParams p = makeParams(7, 0.1f);

    SECTION("first step populates blobCount blobs") {
        REQUIRE(sim.blobs().empty());
        sim.step(p, 0.0f, 0.0f, 0.016f, 0.0f);
        REQUIRE(sim.blobCount() == 7);
    }

    SECTION("reset seeds blobs inside the domain with positive radius") {
        sim.reset(p);
        REQUIRE(sim.blobCount() == 7);
        for (const Blob& b : sim.blobs()) {
            REQUIRE(b.position.x >= 0.0f);
            REQUIRE(b.position.x < 1.0f);
            REQUIRE(b.position.y >= 0.0f);
            REQUIRE(b.position.y <= 1.0f);
            REQUIRE(std::abs(b.velocity.x) <= 0.05f);
            REQUIRE(std::abs(b.velocity.y) <= 0.05f);
            REQUIRE(b.radius >= 0.01f);
            REQUIRE(b.color == p.rgbPrimary);
        }
    }

    SECTION("radius floor applies to tiny means") {
        sim.reset(makeParams(20, 0.0f));
        for (const Blob& b : sim.blobs()) {
            REQUIRE(b.radius >= 0.01f);
        }
    }
}

TEST_CASE("FluidSimulation count reconciliation", "[simulation]") {
    FluidSimulation sim(SimulationSettings(), 11);

    SECTION("grows and shrinks to the target every step") {
        for (int count : {5, 12, 3, 13, 8, 0, 4}) {
            sim.step(makeParams(count), 0.5f, 0.5f, 0.016f, 1.0f);
            REQUIRE(sim.blobCount() == count);
        }
    }

    SECTION("zero or negative count yields an empty set") {
        sim.step(makeParams(0), 0.5f, 0.5f, 0.016f, 0.0f);
        REQUIRE(sim.blobs().empty());
        sim.step(makeParams(-4), 0.5f, 0.5f, 0.016f, 0.0f);
        REQUIRE(sim.blobs().empty());
    }

    SECTION("new blobs start at rest with the mean radius") {
        sim.setBlobs({makeBlob(0.5f, 0.5f, 0.1f)});
        VisualParams p = makeParams(3, 0.07f);
        p.turbulence = 0.0f;
        p.buoyancy = 0.0f;
        p.gravityX = 0.0f;
        sim.step(p, 0.0f, 0.0f, 0.016f, 0.0f);
        REQUIRE(sim.blobCount() == 3);
        for (size_t i = 1; i < sim.blobs().size(); ++i) {
            REQUIRE(sim.blobs()[i].velocity == glm::vec2(0.0f));
            REQUIRE_THAT(sim.blobs()[i].radius, WithinAbs(0.07f, 1e-6f));
        }
    }
}

TEST_CASE("FluidSimulation integration", "[simulation]") {
    FluidSimulation sim;

    SECTION("damping follows viscosity") {
        REQUIRE_THAT(sim.dampingFor(1.0f), WithinAbs(0.995f, 1e-6f));
        REQUIRE_THAT(sim.dampingFor(0.2f), WithinAbs(0.995f - 0.016f, 1e-6f));
    }

    SECTION("velocity field is deterministic") {
        glm::vec2 a = FluidSimulation::fieldAt(0.3f, 0.7f, 2.0f);
        glm::vec2 b = FluidSimulation::fieldAt(0.3f, 0.7f, 2.0f);
        REQUIRE(a == b);
        REQUIRE(std::abs(a.x) <= 1.0f);
        REQUIRE(std::abs(a.y) <= 1.0f);
    }

    SECTION("single blob follows field, bias and damping") {
        VisualParams p = makeParams(1);
        sim.setBlobs({makeBlob(0.4f, 0.5f, 0.05f, 0.1f, 0.0f)});
        sim.step(p, 0.0f, 0.0f, 0.1f, 0.5f);

        glm::vec2 field = FluidSimulation::fieldAt(0.4f, 0.5f, 0.5f);
        float damping = sim.dampingFor(p.viscosity);
        glm::vec2 v = (glm::vec2(0.1f, 0.0f) + (field * p.turbulence + glm::vec2(p.gravityX, p.buoyancy)) * 0.1f) * damping;
        glm::vec2 pos = glm::vec2(0.4f, 0.5f) + v * 0.1f;

        const Blob& b = sim.blobs()[0];
        REQUIRE_THAT(b.velocity.x, WithinAbs(v.x, 1e-5f));
        REQUIRE_THAT(b.velocity.y, WithinAbs(v.y, 1e-5f));
        REQUIRE_THAT(b.position.x, WithinAbs(pos.x, 1e-5f));
        REQUIRE_THAT(b.position.y, WithinAbs(pos.y, 1e-5f));
        REQUIRE(b.color == p.rgbPrimary);
    }

    SECTION("x wraps around the domain width") {
        VisualParams p = makeParams(1);
        p.turbulence = 0.0f;
        p.gravityX = 0.0f;
        p.buoyancy = 0.0f;
        sim.setBlobs({makeBlob(0.99f, 0.5f, 0.05f, 1.0f, 0.0f)});
        sim.step(p, 0.0f, 0.0f, 0.1f, 0.0f);
        float x = sim.blobs()[0].position.x;
        REQUIRE(x >= 0.0f);
        REQUIRE(x < 0.2f);

        sim.setBlobs({makeBlob(0.01f, 0.5f, 0.05f, -1.0f, 0.0f)});
        sim.step(p, 0.0f, 0.0f, 0.1f, 0.0f);
        x = sim.blobs()[0].position.x;
        REQUIRE(x > 0.8f);
        REQUIRE(x < 1.0f);
    }

    SECTION("y clamps at floor and ceiling") {
        VisualParams p = makeParams(1);
        p.turbulence = 0.0f;
        p.gravityX = 0.0f;
        p.buoyancy = 0.0f;
        sim.setBlobs({makeBlob(0.5f, 0.98f, 0.05f, 0.0f, 5.0f)});
        sim.step(p, 0.0f, 0.0f, 0.1f, 0.0f);
        REQUIRE(sim.blobs()[0].position.y == 1.0f);

        sim.setBlobs({makeBlob(0.5f, 0.02f, 0.05f, 0.0f, -5.0f)});
        sim.step(p, 0.0f, 0.0f, 0.1f, 0.0f);
        REQUIRE(sim.blobs()[0].position.y == 0.0f);
    }
}

TEST_CASE("FluidSimulation merge", "[simulation][topology]") {
    FluidSimulation sim(SimulationSettings(), 21);
    VisualParams p = makeParams(2, 0.2f);
    p.turbulence = 0.0f;
    p.gravityX = 0.0f;
    p.buoyancy = 0.0f;

    SECTION("overlapping blobs merge with area conservation when nd = 1") {
        sim.setBlobs({makeBlob(0.5f, 0.5f, 0.06f, 0.02f, 0.0f),
                      makeBlob(0.52f, 0.5f, 0.08f, -0.04f, 0.02f)});
        sim.step(p, 1.0f, 0.0f, 0.0f, 0.0f);

        // One survivor plus one reconciled newcomer
        REQUIRE(sim.blobCount() == 2);
        const Blob& merged = sim.blobs()[0];
        REQUIRE_THAT(merged.radius * merged.radius, WithinAbs(0.06f * 0.06f + 0.08f * 0.08f, 1e-6f));
        REQUIRE_THAT(merged.radius, WithinAbs(0.1f, 1e-6f));
        const float damping = sim.dampingFor(p.viscosity);
        REQUIRE_THAT(merged.velocity.x, WithinAbs(-0.01f * damping, 1e-6f));
        REQUIRE_THAT(merged.velocity.y, WithinAbs(0.01f * damping, 1e-6f));
        REQUIRE(sim.blobs()[1].velocity == glm::vec2(0.0f));
    }

    SECTION("no merge when nd = 0") {
        sim.setBlobs({makeBlob(0.5f, 0.5f, 0.06f), makeBlob(0.5f, 0.5f, 0.08f)});
        sim.step(p, 0.0f, 0.0f, 0.0f, 0.0f);
        REQUIRE(sim.blobCount() == 2);
        REQUIRE_THAT(sim.blobs()[0].radius, WithinAbs(0.06f, 1e-7f));
        REQUIRE_THAT(sim.blobs()[1].radius, WithinAbs(0.08f, 1e-7f));
    }

    SECTION("distant blobs never merge") {
        sim.setBlobs({makeBlob(0.1f, 0.1f, 0.05f), makeBlob(0.9f, 0.9f, 0.05f)});
        sim.step(p, 1.0f, 0.0f, 0.0f, 0.0f);
        REQUIRE_THAT(sim.blobs()[0].radius, WithinAbs(0.05f, 1e-7f));
        REQUIRE_THAT(sim.blobs()[1].radius, WithinAbs(0.05f, 1e-7f));
    }

    SECTION("reach shrinks to the radii sum at full dominance") {
        // Gap 0.25 between centers, radii sum 0.2
        sim.setBlobs({makeBlob(0.3f, 0.5f, 0.1f), makeBlob(0.55f, 0.5f, 0.1f)});
        sim.step(p, 1.0f, 0.0f, 0.0f, 0.0f);
        REQUIRE_THAT(sim.blobs()[0].radius, WithinAbs(0.1f, 1e-7f));
    }

    SECTION("a survivor can absorb several blobs in one tick") {
        VisualParams p3 = p;
        p3.blobCount = 3;
        sim.setBlobs({makeBlob(0.5f, 0.5f, 0.03f),
                      makeBlob(0.5f, 0.5f, 0.04f),
                      makeBlob(0.5f, 0.5f, 0.12f)});
        sim.step(p3, 1.0f, 0.0f, 0.0f, 0.0f);
        REQUIRE(sim.blobCount() == 3);
        REQUIRE_THAT(sim.blobs()[0].radius, WithinAbs(0.13f, 1e-6f));
    }
}

TEST_CASE("FluidSimulation split", "[simulation][topology]") {
    FluidSimulation sim(SimulationSettings(), 8);
    VisualParams p = makeParams(2, 0.1f);
    p.turbulence = 0.0f;
    p.gravityX = 0.0f;
    p.buoyancy = 0.0f;

    SECTION("oversized blob splits into two r/sqrt(2) halves when na = 1") {
        sim.setBlobs({makeBlob(0.4f, 0.4f, 0.3f, 0.05f, 0.02f)});
        sim.step(p, 0.0f, 1.0f, 0.0f, 0.0f);

        REQUIRE(sim.blobCount() == 2);
        const Blob& parent = sim.blobs()[0];
        const Blob& child = sim.blobs()[1];
        const float expected = 0.3f / std::sqrt(2.0f);
        REQUIRE_THAT(parent.radius, WithinAbs(expected, 1e-6f));
        REQUIRE_THAT(child.radius, WithinAbs(expected, 1e-6f));
        REQUIRE_THAT(child.position.x, WithinAbs(parent.position.x + 0.03f, 1e-6f));
        REQUIRE_THAT(child.position.y, WithinAbs(parent.position.y + 0.03f, 1e-6f));
        REQUIRE_THAT(child.velocity.x, WithinAbs(-parent.velocity.x, 1e-7f));
        REQUIRE_THAT(child.velocity.y, WithinAbs(parent.velocity.y, 1e-7f));
        REQUIRE(child.color == parent.color);
    }

    SECTION("no split when na = 0") {
        VisualParams p1 = p;
        p1.blobCount = 1;
        sim.setBlobs({makeBlob(0.4f, 0.4f, 0.3f)});
        sim.step(p1, 0.0f, 0.0f, 0.0f, 0.0f);
        REQUIRE(sim.blobCount() == 1);
        REQUIRE_THAT(sim.blobs()[0].radius, WithinAbs(0.3f, 1e-7f));
    }

    SECTION("blobs below 1.8x the mean never split") {
        sim.setBlobs({makeBlob(0.2f, 0.2f, 0.17f), makeBlob(0.8f, 0.8f, 0.1f)});
        sim.step(p, 0.0f, 1.0f, 0.0f, 0.0f);
        REQUIRE_THAT(sim.blobs()[0].radius, WithinAbs(0.17f, 1e-7f));
        REQUIRE_THAT(sim.blobs()[1].radius, WithinAbs(0.1f, 1e-7f));
    }

    SECTION("split child wraps horizontally and clamps vertically") {
        sim.setBlobs({makeBlob(0.99f, 0.99f, 0.3f)});
        sim.step(p, 0.0f, 1.0f, 0.0f, 0.0f);
        const Blob& child = sim.blobs()[1];
        REQUIRE_THAT(child.position.x, WithinAbs(0.02f, 1e-5f));
        REQUIRE(child.position.y == 1.0f);
    }
}

TEST_CASE("FluidSimulation invariants over long runs", "[simulation]") {
    FluidSimulation sim(SimulationSettings(), 5);
    VisualMapping mapper(MappingSettings(), 5);

    float t = 0.0f;
    for (int i = 0; i < 1500; ++i) {
        float phase = static_cast<float>(i) * 0.01f;
        SmoothedEmotion e(std::sin(phase), std::sin(phase * 1.7f), std::cos(phase * 0.6f));
        VisualParams p = mapper.map(e, 3.0f, t);
        sim.step(p, normalized(e.dominance), normalized(e.arousal), 0.016f, t);
        t += 0.016f;

        REQUIRE(sim.blobCount() == p.blobCount);
        for (const Blob& b : sim.blobs()) {
            REQUIRE(b.position.x >= 0.0f);
            REQUIRE(b.position.x < sim.width());
            REQUIRE(b.position.y >= 0.0f);
            REQUIRE(b.position.y <= sim.height());
            REQUIRE(b.radius > 0.0f);
            REQUIRE(std::isfinite(b.velocity.x));
            REQUIRE(std::isfinite(b.velocity.y));
        }
    }
}

TEST_CASE("FluidSimulation is reproducible with a fixed seed", "[simulation]") {
    FluidSimulation a(SimulationSettings(), 77);
    FluidSimulation b(SimulationSettings(), 77);
    VisualParams p = makeParams(10, 0.12f);

    for (int i = 0; i < 200; ++i) {
        float t = static_cast<float>(i) * 0.016f;
        a.step(p, 0.7f, 0.6f, 0.016f, t);
        b.step(p, 0.7f, 0.6f, 0.016f, t);
    }

    REQUIRE(a.blobCount() == b.blobCount());
    for (size_t i = 0; i < a.blobs().size(); ++i) {
        REQUIRE(a.blobs()[i].position == b.blobs()[i].position);
        REQUIRE(a.blobs()[i].radius == b.blobs()[i].radius);
    }
}
