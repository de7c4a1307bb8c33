#pragma once

#include "ledge/core/Collaborators.hh"
#include "ledge/core/PhysicsWorld.hh"

namespace ledge {

class PlatformerController;

// Binds one character body in a PhysicsWorld to the controller-facing
// PhysicsBody / EnvironmentQuery interfaces. Probes skip the character's own
// body.
class JoltCharacterBody final : public PhysicsBody, public EnvironmentQuery {
  public:
    // Throws LedgeException if handle is not a live body of world
    JoltCharacterBody(PhysicsWorld& world, BodyHandle handle);
    ~JoltCharacterBody() override;

    JoltCharacterBody(const JoltCharacterBody&) = delete;
    JoltCharacterBody& operator=(const JoltCharacterBody&) = delete;

    Vec2f position() const override;
    Velocity2f velocity() const override;
    void setVelocity(const Velocity2f& velocity) override;
    void applyImpulse(const Velocity2f& impulse) override;

    ProbeHit probe(const Vec2f& origin, const Vec2f& direction, float distance, LayerMask layers) const override;

    // Route this body's contact begin/end events into controller. The
    // controller must outlive the binding or be detached first.
    void attach(PlatformerController& controller);
    void detach();
    bool attached() const;

    BodyHandle handle() const;

  private:
    PhysicsWorld* world_;
    BodyHandle handle_;
    bool attached_ = false;
};

} // namespace ledge
