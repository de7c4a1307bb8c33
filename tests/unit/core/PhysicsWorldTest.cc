#include "ledge/core/PhysicsWorld.hh"

#include <cmath>
#include <gtest/gtest.h>
#include <vector>

using namespace ledge;

namespace {

constexpr float kStep = 1.0f / 60.0f;

void stepFor(PhysicsWorld& pw, float seconds) {
    int steps = static_cast<int>(std::lround(seconds / kStep));
    for (int i = 0; i < steps; ++i)
        pw.step(kStep);
}

} // namespace

// Lifecycle tests

TEST(PhysicsWorldTest, Instantiation) {
    PhysicsWorld pw;
    EXPECT_FALSE(pw.initialized());
}

TEST(PhysicsWorldTest, InitShutdown) {
    PhysicsWorld pw;
    pw.init();
    EXPECT_TRUE(pw.initialized());
    pw.shutdown();
    EXPECT_FALSE(pw.initialized());
}

TEST(PhysicsWorldTest, DoubleInitIsNoop) {
    PhysicsWorld pw;
    pw.init();
    pw.init(); // should not crash
    EXPECT_TRUE(pw.initialized());
    pw.shutdown();
}

TEST(PhysicsWorldTest, DoubleShutdownIsNoop) {
    PhysicsWorld pw;
    pw.init();
    pw.shutdown();
    pw.shutdown(); // should not crash
    EXPECT_FALSE(pw.initialized());
}

TEST(PhysicsWorldTest, JoltSystemAccessible) {
    PhysicsWorld pw;
    EXPECT_EQ(pw.joltSystem(), nullptr);
    pw.init();
    EXPECT_NE(pw.joltSystem(), nullptr);
    pw.shutdown();
    EXPECT_EQ(pw.joltSystem(), nullptr);
}

TEST(PhysicsWorldTest, StepBeforeInitIsNoop) {
    PhysicsWorld pw;
    pw.step(kStep);
    SUCCEED();
}

// Gravity

TEST(PhysicsWorldTest, GravityConfigurable) {
    PhysicsWorld pw;
    pw.init();
    EXPECT_NEAR(pw.gravity(), -9.81f, 0.01f);

    pw.setGravity(-25.0f);
    EXPECT_FLOAT_EQ(pw.gravity(), -25.0f);
}

// Body creation

TEST(PhysicsWorldTest, CreateStaticBox) {
    PhysicsWorld pw;
    pw.init();

    auto handle = pw.createStaticBox(0.0f, -0.5f, 10.0f, 0.5f);
    EXPECT_TRUE(handle.valid());

    auto pos = pw.bodyPosition(handle);
    EXPECT_NEAR(pos.x, 0.0f, 0.001f);
    EXPECT_NEAR(pos.y, -0.5f, 0.001f);
}

TEST(PhysicsWorldTest, CreateBeforeInitIsInvalid) {
    PhysicsWorld pw;
    EXPECT_FALSE(pw.createStaticBox(0.0f, 0.0f, 1.0f, 1.0f).valid());
    EXPECT_FALSE(pw.createCharacterBody(0.0f, 0.0f).valid());
}

TEST(PhysicsWorldTest, CreateStaticBoxRejectsBadInput) {
    PhysicsWorld pw;
    pw.init();

    EXPECT_FALSE(pw.createStaticBox(0.0f, 0.0f, 0.0f, 1.0f).valid());
    EXPECT_FALSE(pw.createStaticBox(0.0f, 0.0f, 1.0f, 1.0f, physics::kLayerCharacter).valid());
}

TEST(PhysicsWorldTest, CharacterFallsUnderGravity) {
    PhysicsWorld pw;
    pw.init();
    auto ch = pw.createCharacterBody(0.0f, 10.0f);
    ASSERT_TRUE(ch.valid());

    stepFor(pw, 0.5f);

    EXPECT_LT(pw.bodyPosition(ch).y, 10.0f);
    EXPECT_LT(pw.linearVelocity(ch).y, 0.0f);
    EXPECT_NEAR(pw.bodyPosition(ch).x, 0.0f, 0.001f);
}

TEST(PhysicsWorldTest, CharacterLandsOnFloor) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(0.0f, -0.5f, 10.0f, 0.5f);
    CharacterBodySettings settings;
    auto ch = pw.createCharacterBody(0.0f, 3.0f, settings);

    stepFor(pw, 2.0f);

    EXPECT_NEAR(pw.bodyPosition(ch).y, settings.halfHeight, 0.1f);
    EXPECT_NEAR(pw.linearVelocity(ch).y, 0.0f, 0.5f);
}

// Velocity and impulses

TEST(PhysicsWorldTest, SetLinearVelocity) {
    PhysicsWorld pw;
    pw.init();
    auto ch = pw.createCharacterBody(0.0f, 5.0f);

    pw.setLinearVelocity(ch, Velocity2f(3.0f, -1.0f));
    auto v = pw.linearVelocity(ch);

    EXPECT_NEAR(v.x, 3.0f, 0.001f);
    EXPECT_NEAR(v.y, -1.0f, 0.001f);
}

TEST(PhysicsWorldTest, ImpulseScaledByMass) {
    PhysicsWorld pw;
    pw.init();
    CharacterBodySettings heavy;
    heavy.mass = 2.0f;
    auto unit = pw.createCharacterBody(0.0f, 5.0f);
    auto ch = pw.createCharacterBody(5.0f, 5.0f, heavy);

    pw.applyImpulse(unit, Velocity2f(2.0f, 5.0f));
    pw.applyImpulse(ch, Velocity2f(2.0f, 5.0f));

    EXPECT_NEAR(pw.linearVelocity(unit).x, 2.0f, 0.001f);
    EXPECT_NEAR(pw.linearVelocity(unit).y, 5.0f, 0.001f);
    EXPECT_NEAR(pw.linearVelocity(ch).x, 1.0f, 0.001f);
    EXPECT_NEAR(pw.linearVelocity(ch).y, 2.5f, 0.001f);
}

// Ray casts

TEST(PhysicsWorldTest, CastRayHitsWall) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(3.0f, 1.0f, 0.5f, 2.0f, physics::kLayerWall);

    auto hit = pw.castRay(Vec2f(0.0f, 1.0f), Vec2f(1.0f, 0.0f), 5.0f, layerBit(physics::kLayerWall));

    ASSERT_TRUE(hit.hit);
    EXPECT_NEAR(hit.distance, 2.5f, 0.01f);
    EXPECT_NEAR(hit.point.x, 2.5f, 0.01f);
    EXPECT_NEAR(hit.normal.x, -1.0f, 0.01f);
    EXPECT_NEAR(hit.normal.y, 0.0f, 0.01f);
}

TEST(PhysicsWorldTest, CastRayRespectsLayerMask) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(3.0f, 1.0f, 0.5f, 2.0f, physics::kLayerGround);

    auto hit = pw.castRay(Vec2f(0.0f, 1.0f), Vec2f(1.0f, 0.0f), 5.0f, layerBit(physics::kLayerWall));
    EXPECT_FALSE(hit.hit);
}

TEST(PhysicsWorldTest, CastRayOutOfRange) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(3.0f, 1.0f, 0.5f, 2.0f, physics::kLayerWall);

    auto hit = pw.castRay(Vec2f(0.0f, 1.0f), Vec2f(1.0f, 0.0f), 1.0f, layerBit(physics::kLayerWall));
    EXPECT_FALSE(hit.hit);
}

TEST(PhysicsWorldTest, CastRaySkipsIgnoredBody) {
    PhysicsWorld pw;
    pw.init();
    auto wall = pw.createStaticBox(3.0f, 1.0f, 0.5f, 2.0f, physics::kLayerWall);
    auto ch = pw.createCharacterBody(0.0f, 1.0f);
    LayerMask mask = layerBit(physics::kLayerWall) | layerBit(physics::kLayerCharacter);

    auto hit = pw.castRay(Vec2f(0.0f, 1.0f), Vec2f(1.0f, 0.0f), 5.0f, mask, ch);

    ASSERT_TRUE(hit.hit);
    EXPECT_EQ(hit.body, wall.id);
}

TEST(PhysicsWorldTest, RemovedBodyNoLongerHit) {
    PhysicsWorld pw;
    pw.init();
    auto wall = pw.createStaticBox(3.0f, 1.0f, 0.5f, 2.0f, physics::kLayerWall);
    pw.removeBody(wall);

    auto hit = pw.castRay(Vec2f(0.0f, 1.0f), Vec2f(1.0f, 0.0f), 5.0f, layerBit(physics::kLayerWall));
    EXPECT_FALSE(hit.hit);
}

// Contact events

TEST(PhysicsWorldTest, LandingReportsUpwardNormal) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(0.0f, -0.5f, 10.0f, 0.5f);
    auto ch = pw.createCharacterBody(0.0f, 1.5f);

    std::vector<ContactPoint> landed;
    int begins = 0;
    pw.setContactHandlers(
        ch,
        [&](std::span<const ContactPoint> contacts) {
            ++begins;
            landed.assign(contacts.begin(), contacts.end());
        },
        nullptr);

    stepFor(pw, 1.0f);

    EXPECT_GE(begins, 1);
    ASSERT_FALSE(landed.empty());
    EXPECT_GT(landed.front().normal.y, 0.9f);
}

TEST(PhysicsWorldTest, ContactEndOnLeavingFloor) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(0.0f, -0.5f, 10.0f, 0.5f);
    auto ch = pw.createCharacterBody(0.0f, 1.5f);

    int ends = 0;
    bool touching = false;
    pw.setContactHandlers(
        ch, [&](std::span<const ContactPoint>) { touching = true; },
        [&]() {
            touching = false;
            ++ends;
        });

    stepFor(pw, 1.0f);
    ASSERT_TRUE(touching);

    pw.setLinearVelocity(ch, Velocity2f(0.0f, 8.0f));
    stepFor(pw, 0.25f);

    EXPECT_FALSE(touching);
    EXPECT_GE(ends, 1);
}

TEST(PhysicsWorldTest, FloorContactOutlastsWallContactEnd) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(0.0f, -0.5f, 10.0f, 0.5f);
    // Wall face at x = 2.0, character resting against it
    pw.createStaticBox(2.5f, 5.0f, 0.5f, 5.0f, physics::kLayerWall);
    CharacterBodySettings settings;
    auto ch = pw.createCharacterBody(2.0f - settings.halfWidth, settings.halfHeight + 0.05f, settings);

    bool onFloor = false;
    pw.setContactHandlers(
        ch,
        [&](std::span<const ContactPoint> contacts) {
            for (const auto& c : contacts)
                if (c.normal.y > 0.9f)
                    onFloor = true;
        },
        [&]() { onFloor = false; });

    stepFor(pw, 0.5f);
    ASSERT_TRUE(onFloor);

    // Slide away from the wall; the floor contact persists throughout
    for (int i = 0; i < 30; ++i) {
        pw.setLinearVelocity(ch, Velocity2f(-4.0f, pw.linearVelocity(ch).y));
        pw.step(kStep);
        ASSERT_TRUE(onFloor) << "step " << i;
    }
    EXPECT_LT(pw.bodyPosition(ch).x, 2.0f - settings.halfWidth - 1.0f);
}

TEST(PhysicsWorldTest, ClearedHandlersAreNotCalled) {
    PhysicsWorld pw;
    pw.init();
    pw.createStaticBox(0.0f, -0.5f, 10.0f, 0.5f);
    auto ch = pw.createCharacterBody(0.0f, 1.5f);

    int begins = 0;
    pw.setContactHandlers(ch, [&](std::span<const ContactPoint>) { ++begins; }, nullptr);
    pw.clearContactHandlers(ch);

    stepFor(pw, 1.0f);
    EXPECT_EQ(begins, 0);
}
