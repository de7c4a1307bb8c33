#pragma once

#include <Jolt/Jolt.h>

#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>
#include <Jolt/Physics/Collision/ContactListener.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/PhysicsSystem.h>

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Spatial.hh"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <unordered_map>
#include <vector>

namespace ledge {

namespace physics {

inline constexpr JPH::ObjectLayer kLayerGround = 0;
inline constexpr JPH::ObjectLayer kLayerWall = 1;
inline constexpr JPH::ObjectLayer kLayerCharacter = 2;
inline constexpr int kNumObjectLayers = 3;

inline constexpr JPH::BroadPhaseLayer kBPLayerNonMoving(0);
inline constexpr JPH::BroadPhaseLayer kBPLayerMoving(1);
inline constexpr int kNumBroadPhaseLayers = 2;

// Level geometry lives in a thin slab around z = 0
inline constexpr float kSlabHalfDepth = 0.5f;

class BPLayerInterface final : public JPH::BroadPhaseLayerInterface {
  public:
    JPH::uint GetNumBroadPhaseLayers() const override { return kNumBroadPhaseLayers; }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        if (inLayer == kLayerCharacter)
            return kBPLayerMoving;
        return kBPLayerNonMoving;
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        if (inLayer == kBPLayerNonMoving)
            return "NON_MOVING";
        if (inLayer == kBPLayerMoving)
            return "MOVING";
        return "UNKNOWN";
    }
#endif
};

class ObjectVsBPFilter final : public JPH::ObjectVsBroadPhaseLayerFilter {
  public:
    bool ShouldCollide(JPH::ObjectLayer inLayer, JPH::BroadPhaseLayer inBPLayer) const override {
        if (inLayer != kLayerCharacter)
            return inBPLayer == kBPLayerMoving;
        return true;
    }
};

// Characters collide with level geometry, not with each other
class ObjectPairFilter final : public JPH::ObjectLayerPairFilter {
  public:
    bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::ObjectLayer inLayer2) const override {
        return (inLayer1 == kLayerCharacter) != (inLayer2 == kLayerCharacter);
    }
};

// Ray/query filter selecting object layers by LayerMask bit
class LayerMaskFilter final : public JPH::ObjectLayerFilter {
  public:
    explicit LayerMaskFilter(LayerMask mask) : mask_(mask) {}

    bool ShouldCollide(JPH::ObjectLayer inLayer) const override {
        return inLayer < 32 && (mask_ & layerBit(inLayer)) != 0;
    }

  private:
    LayerMask mask_;
};

} // namespace physics

struct BodyHandle {
    JPH::BodyID id;
    bool valid() const { return !id.IsInvalid(); }
};

struct CharacterBodySettings {
    float halfWidth = 0.4f;
    float halfHeight = 0.9f;
    float mass = 1.0f;
    float friction = 0.0f;
};

struct RayHit {
    bool hit = false;
    float distance = 0.0f;
    Vec2f point;
    Vec2f normal;
    JPH::BodyID body;
};

using ContactBeginHandler = std::function<void(std::span<const ContactPoint>)>;
using ContactEndHandler = std::function<void()>;

// Jolt world constrained to the XY plane. Contact callbacks from Jolt's job
// threads are queued and replayed on the caller's thread at the end of
// step(), so handlers always run between physics steps.
class PhysicsWorld {
  public:
    PhysicsWorld();
    ~PhysicsWorld();

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    void init(uint32_t maxBodies = 1024, int numThreads = 0);
    void shutdown();
    void step(float dt, int collisionSteps = 1);

    void setGravity(float gy);
    float gravity() const;

    // Axis-aligned static box. layer is kLayerGround or kLayerWall.
    BodyHandle createStaticBox(float cx, float cy, float halfWidth, float halfHeight,
                               JPH::ObjectLayer layer = physics::kLayerGround);

    // Dynamic box translating in X/Y only, never rotating, never sleeping
    BodyHandle createCharacterBody(float px, float py, const CharacterBodySettings& settings = {});

    void removeBody(BodyHandle handle);

    Vec2f bodyPosition(BodyHandle handle) const;
    Velocity2f linearVelocity(BodyHandle handle) const;
    void setLinearVelocity(BodyHandle handle, const Velocity2f& velocity);
    void applyImpulse(BodyHandle handle, const Velocity2f& impulse);

    // Cast from origin along direction (unit) for distance, hitting only
    // bodies whose layer bit is in layers. ignore is skipped if valid.
    RayHit castRay(const Vec2f& origin, const Vec2f& direction, float distance, LayerMask layers,
                   BodyHandle ignore = {}) const;

    void setContactHandlers(BodyHandle handle, ContactBeginHandler onBegin, ContactEndHandler onEnd);
    void clearContactHandlers(BodyHandle handle);

    JPH::PhysicsSystem* joltSystem();
    bool initialized() const;

  private:
    class ContactListenerImpl;

    struct ContactHandlers {
        ContactBeginHandler onBegin;
        ContactEndHandler onEnd;
    };

    void dispatchContacts();

    bool initialized_ = false;
    std::unique_ptr<JPH::TempAllocatorImpl> tempAllocator_;
    std::unique_ptr<JPH::JobSystemThreadPool> jobSystem_;
    std::unique_ptr<JPH::PhysicsSystem> physicsSystem_;
    std::unique_ptr<ContactListenerImpl> contactListener_;

    physics::BPLayerInterface bpLayerInterface_;
    physics::ObjectVsBPFilter objectVsBPFilter_;
    physics::ObjectPairFilter objectPairFilter_;

    std::vector<JPH::BodyID> bodies_;
    std::unordered_map<uint32_t, ContactHandlers> contactHandlers_;
};

} // namespace ledge
