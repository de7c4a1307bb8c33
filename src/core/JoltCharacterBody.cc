#include "ledge/core/JoltCharacterBody.hh"

#include "ledge/core/Log.hh"
#include "ledge/core/PlatformerController.hh"
#include "ledge/utils/ErrorHandling.hh"

namespace ledge {

JoltCharacterBody::JoltCharacterBody(PhysicsWorld& world, BodyHandle handle) : world_(&world), handle_(handle) {
    if (!world.initialized()) {
        throwError("JoltCharacterBody requires an initialized PhysicsWorld");
    }
    if (!handle.valid()) {
        throwError("JoltCharacterBody requires a valid body handle");
    }
}

JoltCharacterBody::~JoltCharacterBody() {
    detach();
}

Vec2f JoltCharacterBody::position() const {
    return world_->bodyPosition(handle_);
}

Velocity2f JoltCharacterBody::velocity() const {
    return world_->linearVelocity(handle_);
}

void JoltCharacterBody::setVelocity(const Velocity2f& velocity) {
    world_->setLinearVelocity(handle_, velocity);
}

void JoltCharacterBody::applyImpulse(const Velocity2f& impulse) {
    world_->applyImpulse(handle_, impulse);
}

ProbeHit JoltCharacterBody::probe(const Vec2f& origin, const Vec2f& direction, float distance,
                                  LayerMask layers) const {
    auto hit = world_->castRay(origin, direction, distance, layers, handle_);
    ProbeHit result;
    result.hit = hit.hit;
    result.distance = hit.distance;
    result.normal = hit.normal;
    return result;
}

void JoltCharacterBody::attach(PlatformerController& controller) {
    world_->setContactHandlers(
        handle_, [&controller](std::span<const ContactPoint> contacts) { controller.onContactBegin(contacts); },
        [&controller]() { controller.onContactEnd(); });
    attached_ = true;
    LEDGE_PHYSICS_DEBUG("Controller attached to body {}", handle_.id.GetIndex());
}

void JoltCharacterBody::detach() {
    if (!attached_)
        return;
    world_->clearContactHandlers(handle_);
    attached_ = false;
}

bool JoltCharacterBody::attached() const {
    return attached_;
}

BodyHandle JoltCharacterBody::handle() const {
    return handle_;
}

} // namespace ledge
