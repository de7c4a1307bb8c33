#include "ledge/core/PhysicsWorld.hh"
#include "ledge/core/Log.hh"

#include <Jolt/Core/Factory.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Body/BodyInterface.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseQuery.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/RegisterTypes.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace ledge {

namespace {

JPH::Vec3 toJolt(const Vec2f& v) {
    return JPH::Vec3(v.x, v.y, 0.0f);
}

Vec2f toVec2(JPH::RVec3Arg v) {
    return Vec2f(static_cast<float>(v.GetX()), static_cast<float>(v.GetY()));
}

uint32_t bodyKey(const JPH::BodyID& id) {
    return id.GetIndexAndSequenceNumber();
}

} // namespace

// Collects contact begin/end events for character bodies. Added and
// persisted contacts both count as begins. Jolt calls this
// from its job threads, so events are only queued here and handed to
// handlers by PhysicsWorld::dispatchContacts() after the step.
class PhysicsWorld::ContactListenerImpl final : public JPH::ContactListener {
  public:
    struct QueuedEvent {
        JPH::BodyID body;
        bool begin = false;
        std::vector<ContactPoint> points;
    };

    JPH::ValidateResult OnContactValidate([[maybe_unused]] const JPH::Body& inBody1,
                                          [[maybe_unused]] const JPH::Body& inBody2,
                                          [[maybe_unused]] JPH::RVec3Arg inBaseOffset,
                                          [[maybe_unused]] const JPH::CollideShapeResult& inCollisionResult) override {
        return JPH::ValidateResult::AcceptAllContactsForThisBodyPair;
    }

    void OnContactAdded(const JPH::Body& inBody1, const JPH::Body& inBody2, const JPH::ContactManifold& inManifold,
                        [[maybe_unused]] JPH::ContactSettings& ioSettings) override {
        queueCharacterBegins(inBody1, inBody2, inManifold);
    }

    // Re-asserts ground contact that survived another contact ending
    void OnContactPersisted(const JPH::Body& inBody1, const JPH::Body& inBody2, const JPH::ContactManifold& inManifold,
                            [[maybe_unused]] JPH::ContactSettings& ioSettings) override {
        queueCharacterBegins(inBody1, inBody2, inManifold);
    }

    // Body layers are not accessible here; dispatch drops ids without handlers
    void OnContactRemoved(const JPH::SubShapeIDPair& inSubShapePair) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(QueuedEvent{inSubShapePair.GetBody1ID(), false, {}});
        queue_.push_back(QueuedEvent{inSubShapePair.GetBody2ID(), false, {}});
    }

    std::vector<QueuedEvent> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<QueuedEvent> out;
        out.swap(queue_);
        return out;
    }

  private:
    void queueCharacterBegins(const JPH::Body& body1, const JPH::Body& body2, const JPH::ContactManifold& manifold) {
        // The manifold normal pushes body 2 out of body 1
        if (body1.GetObjectLayer() == physics::kLayerCharacter)
            queueBegin(body1.GetID(), manifold, -manifold.mWorldSpaceNormal);
        if (body2.GetObjectLayer() == physics::kLayerCharacter)
            queueBegin(body2.GetID(), manifold, manifold.mWorldSpaceNormal);
    }

    void queueBegin(const JPH::BodyID& body, const JPH::ContactManifold& manifold, JPH::Vec3Arg normal) {
        QueuedEvent ev{body, true, {}};
        Vec2f n(normal.GetX(), normal.GetY());
        for (JPH::uint i = 0; i < manifold.mRelativeContactPointsOn1.size(); ++i) {
            ev.points.push_back(ContactPoint{toVec2(manifold.GetWorldSpaceContactPointOn1(i)), n});
        }
        if (ev.points.empty()) {
            ev.points.push_back(ContactPoint{toVec2(manifold.mBaseOffset), n});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(ev));
    }

    std::mutex mutex_;
    std::vector<QueuedEvent> queue_;
};

// Track whether Jolt global state has been initialized in this process
static bool sJoltGlobalInit = false;

static void ensureJoltGlobalInit() {
    if (sJoltGlobalInit)
        return;
    JPH::RegisterDefaultAllocator();
    JPH::Factory::sInstance = new JPH::Factory();
    JPH::RegisterTypes();
    sJoltGlobalInit = true;
}

PhysicsWorld::PhysicsWorld() = default;

PhysicsWorld::~PhysicsWorld() {
    if (initialized_)
        shutdown();
}

void PhysicsWorld::init(uint32_t maxBodies, int numThreads) {
    if (initialized_)
        return;

    ensureJoltGlobalInit();

    // 4 MB is plenty for a handful of boxes and characters
    tempAllocator_ = std::make_unique<JPH::TempAllocatorImpl>(4 * 1024 * 1024);

    int threads = (numThreads <= 0) ? 1 : numThreads;
    jobSystem_ = std::make_unique<JPH::JobSystemThreadPool>(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, threads);

    physicsSystem_ = std::make_unique<JPH::PhysicsSystem>();
    physicsSystem_->Init(maxBodies,
                         0,             // auto body mutexes
                         maxBodies * 2, // max body pairs
                         maxBodies,     // max contact constraints
                         bpLayerInterface_, objectVsBPFilter_, objectPairFilter_);

    contactListener_ = std::make_unique<ContactListenerImpl>();
    physicsSystem_->SetContactListener(contactListener_.get());

    initialized_ = true;
    LEDGE_PHYSICS_DEBUG("PhysicsWorld initialized ({} bodies, {} threads)", maxBodies, threads);
}

void PhysicsWorld::shutdown() {
    if (!initialized_)
        return;

    auto& bi = physicsSystem_->GetBodyInterface();
    for (auto& bodyId : bodies_) {
        bi.RemoveBody(bodyId);
        bi.DestroyBody(bodyId);
    }
    bodies_.clear();
    contactHandlers_.clear();

    physicsSystem_.reset();
    contactListener_.reset();
    jobSystem_.reset();
    tempAllocator_.reset();

    initialized_ = false;
    LEDGE_PHYSICS_DEBUG("PhysicsWorld shut down");
}

void PhysicsWorld::step(float dt, int collisionSteps) {
    if (!initialized_ || dt <= 0.0f)
        return;
    physicsSystem_->Update(dt, collisionSteps, tempAllocator_.get(), jobSystem_.get());
    dispatchContacts();
}

void PhysicsWorld::dispatchContacts() {
    auto events = contactListener_->drain();
    // Jolt reports removals after additions; replay ends first so contacts
    // still present after the step have the last word
    std::stable_partition(events.begin(), events.end(), [](const auto& ev) { return !ev.begin; });
    for (auto& ev : events) {
        auto it = contactHandlers_.find(bodyKey(ev.body));
        if (it == contactHandlers_.end())
            continue;

        if (ev.begin) {
            if (it->second.onBegin)
                it->second.onBegin(std::span<const ContactPoint>(ev.points));
        } else if (it->second.onEnd) {
            it->second.onEnd();
        }
    }
}

void PhysicsWorld::setGravity(float gy) {
    if (!initialized_)
        return;
    physicsSystem_->SetGravity(JPH::Vec3(0.0f, gy, 0.0f));
}

float PhysicsWorld::gravity() const {
    if (!initialized_)
        return 0.0f;
    return physicsSystem_->GetGravity().GetY();
}

BodyHandle PhysicsWorld::createStaticBox(float cx, float cy, float halfWidth, float halfHeight,
                                         JPH::ObjectLayer layer) {
    if (!initialized_ || halfWidth <= 0.0f || halfHeight <= 0.0f || layer == physics::kLayerCharacter)
        return BodyHandle{JPH::BodyID()};

    JPH::RefConst<JPH::Shape> shape = new JPH::BoxShape(JPH::Vec3(halfWidth, halfHeight, physics::kSlabHalfDepth));
    JPH::BodyCreationSettings settings(shape, JPH::RVec3(cx, cy, 0.0f), JPH::Quat::sIdentity(),
                                       JPH::EMotionType::Static, layer);

    auto& bi = physicsSystem_->GetBodyInterface();
    JPH::Body* body = bi.CreateBody(settings);
    if (body == nullptr)
        return BodyHandle{JPH::BodyID()};

    bi.AddBody(body->GetID(), JPH::EActivation::DontActivate);
    bodies_.push_back(body->GetID());
    return BodyHandle{body->GetID()};
}

BodyHandle PhysicsWorld::createCharacterBody(float px, float py, const CharacterBodySettings& cfg) {
    if (!initialized_ || cfg.halfWidth <= 0.0f || cfg.halfHeight <= 0.0f)
        return BodyHandle{JPH::BodyID()};

    // Convex radius must stay below the smallest half extent
    float convexRadius = std::min({JPH::cDefaultConvexRadius, cfg.halfWidth * 0.5f, cfg.halfHeight * 0.5f});
    JPH::RefConst<JPH::Shape> shape =
        new JPH::BoxShape(JPH::Vec3(cfg.halfWidth, cfg.halfHeight, physics::kSlabHalfDepth), convexRadius);

    JPH::BodyCreationSettings settings(shape, JPH::RVec3(px, py, 0.0f), JPH::Quat::sIdentity(),
                                       JPH::EMotionType::Dynamic, physics::kLayerCharacter);
    settings.mAllowedDOFs = JPH::EAllowedDOFs::TranslationX | JPH::EAllowedDOFs::TranslationY;
    settings.mAllowSleeping = false;
    settings.mFriction = cfg.friction;
    settings.mMotionQuality = JPH::EMotionQuality::LinearCast;
    settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
    settings.mMassPropertiesOverride.mMass = cfg.mass;

    auto& bi = physicsSystem_->GetBodyInterface();
    JPH::Body* body = bi.CreateBody(settings);
    if (body == nullptr) {
        LEDGE_PHYSICS_WARN("Character body creation failed at ({}, {})", px, py);
        return BodyHandle{JPH::BodyID()};
    }

    bi.AddBody(body->GetID(), JPH::EActivation::Activate);
    bodies_.push_back(body->GetID());
    return BodyHandle{body->GetID()};
}

void PhysicsWorld::removeBody(BodyHandle handle) {
    if (!initialized_ || !handle.valid())
        return;

    auto& bi = physicsSystem_->GetBodyInterface();
    bi.RemoveBody(handle.id);
    bi.DestroyBody(handle.id);

    auto it = std::find(bodies_.begin(), bodies_.end(), handle.id);
    if (it != bodies_.end())
        bodies_.erase(it);
    contactHandlers_.erase(bodyKey(handle.id));
}

Vec2f PhysicsWorld::bodyPosition(BodyHandle handle) const {
    if (!initialized_ || !handle.valid())
        return Vec2f();
    return toVec2(physicsSystem_->GetBodyInterface().GetCenterOfMassPosition(handle.id));
}

Velocity2f PhysicsWorld::linearVelocity(BodyHandle handle) const {
    if (!initialized_ || !handle.valid())
        return Velocity2f();
    auto v = physicsSystem_->GetBodyInterface().GetLinearVelocity(handle.id);
    return Velocity2f(v.GetX(), v.GetY());
}

void PhysicsWorld::setLinearVelocity(BodyHandle handle, const Velocity2f& velocity) {
    if (!initialized_ || !handle.valid())
        return;
    physicsSystem_->GetBodyInterface().SetLinearVelocity(handle.id, JPH::Vec3(velocity.x, velocity.y, 0.0f));
}

void PhysicsWorld::applyImpulse(BodyHandle handle, const Velocity2f& impulse) {
    if (!initialized_ || !handle.valid())
        return;
    physicsSystem_->GetBodyInterface().AddImpulse(handle.id, JPH::Vec3(impulse.x, impulse.y, 0.0f));
}

RayHit PhysicsWorld::castRay(const Vec2f& origin, const Vec2f& direction, float distance, LayerMask layers,
                             BodyHandle ignore) const {
    RayHit result;
    if (!initialized_ || distance <= 0.0f)
        return result;

    JPH::RRayCast ray{JPH::RVec3(origin.x, origin.y, 0.0f), toJolt(direction) * distance};
    JPH::RayCastResult hit;
    physics::LayerMaskFilter layerFilter(layers);
    JPH::IgnoreSingleBodyFilter ignoreFilter(ignore.id);
    JPH::BodyFilter acceptAll;
    const JPH::BodyFilter& bodyFilter = ignore.valid() ? static_cast<const JPH::BodyFilter&>(ignoreFilter) : acceptAll;

    if (!physicsSystem_->GetNarrowPhaseQuery().CastRay(ray, hit, JPH::BroadPhaseLayerFilter{}, layerFilter,
                                                       bodyFilter))
        return result;

    result.hit = true;
    result.distance = hit.mFraction * distance;
    result.body = hit.mBodyID;

    JPH::RVec3 point = ray.GetPointOnRay(hit.mFraction);
    result.point = toVec2(point);

    JPH::BodyLockRead lock(physicsSystem_->GetBodyLockInterface(), hit.mBodyID);
    if (lock.Succeeded()) {
        JPH::Vec3 n = lock.GetBody().GetWorldSpaceSurfaceNormal(hit.mSubShapeID2, point);
        result.normal = Vec2f(n.GetX(), n.GetY());
    }
    return result;
}

void PhysicsWorld::setContactHandlers(BodyHandle handle, ContactBeginHandler onBegin, ContactEndHandler onEnd) {
    if (!handle.valid())
        return;
    contactHandlers_[bodyKey(handle.id)] = ContactHandlers{std::move(onBegin), std::move(onEnd)};
}

void PhysicsWorld::clearContactHandlers(BodyHandle handle) {
    if (!handle.valid())
        return;
    contactHandlers_.erase(bodyKey(handle.id));
}

JPH::PhysicsSystem* PhysicsWorld::joltSystem() {
    return physicsSystem_.get();
}

bool PhysicsWorld::initialized() const {
    return initialized_;
}

} // namespace ledge
