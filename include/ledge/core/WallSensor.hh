#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Collaborators.hh"

namespace ledge {

class WallSensor {
  public:
    struct WallContact {
        bool touching = false;
        int dirX = 0;
    };

    explicit WallSensor(const EnvironmentQuery& environment);

    // Probe both horizontal directions. Right wins when both report a hit.
    WallContact sense(const Vec2f& position, float distance, LayerMask wallLayer) const;

    // Write the sensed contact into isTouchingWall / wallDirX
    void update(ControllerState& state, const Vec2f& position, const MovementConfig& config) const;

  private:
    const EnvironmentQuery* environment_;
};

} // namespace ledge
