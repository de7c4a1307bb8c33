#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Spatial.hh"

#include <string_view>

namespace ledge {

// Rigid body owned by the host physics engine. The controller reads and
// writes velocity through this interface and never caches it across ticks.
class PhysicsBody {
  public:
    virtual ~PhysicsBody() = default;

    virtual Vec2f position() const = 0;
    virtual Velocity2f velocity() const = 0;
    virtual void setVelocity(const Velocity2f& velocity) = 0;

    // Instantaneous impulse. The engine converts it to a velocity change
    // using the body's mass.
    virtual void applyImpulse(const Velocity2f& impulse) = 0;
};

struct ProbeHit {
    bool hit = false;
    float distance = 0.0f;
    Vec2f normal;
};

// Ray probe against level geometry, filtered by collision layer.
class EnvironmentQuery {
  public:
    virtual ~EnvironmentQuery() = default;

    virtual ProbeHit probe(const Vec2f& origin, const Vec2f& direction, float distance, LayerMask layers) const = 0;
};

// Receives animation parameters. Hosts without an animator pass nullptr.
class AnimationSink {
  public:
    virtual ~AnimationSink() = default;

    virtual void setBool(std::string_view name, bool value) = 0;
    virtual void setTrigger(std::string_view name) = 0;
};

// Visual transform of the character. +1 renders facing right, -1 mirrors
// the sprite horizontally.
class VisualTransform {
  public:
    virtual ~VisualTransform() = default;

    virtual void setFacingSign(int sign) = 0;
};

} // namespace ledge
