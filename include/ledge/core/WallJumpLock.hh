#pragma once

#include "ledge/core/CharacterTypes.hh"

namespace ledge {

// Countdown that suspends horizontal input authority after a wall jump.
// Operates on ControllerState so isWallJumping and wallJumpCounter always
// change together. Stateless; all state lives on ControllerState.
class WallJumpLock {
  public:
    // Arm the lock for config.wallJumpTime seconds
    static void start(ControllerState& state, const MovementConfig& config);

    // Tick the countdown. Returns true on the tick the lock expires.
    static bool update(ControllerState& state, float dt);

    // Clear immediately (landing)
    static void cancel(ControllerState& state);

    static bool active(const ControllerState& state);
};

} // namespace ledge
