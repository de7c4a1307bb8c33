#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Collaborators.hh"

namespace ledge {

class WallSlideEvaluator {
  public:
    // True when the character should slide: touching a wall, airborne, and
    // either pushing into the wall or giving no horizontal input.
    static bool shouldSlide(const ControllerState& state, float horizontal);

    // Recompute isWallSliding. While sliding, the fall speed of body is
    // capped at config.wallSlideSpeed. Always false under wall-jump lock.
    bool evaluate(ControllerState& state, const MovementConfig& config, float horizontal, PhysicsBody& body) const;
};

} // namespace ledge
