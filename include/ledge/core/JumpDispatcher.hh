#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Collaborators.hh"
#include "ledge/core/WallJumpLock.hh"

#include <string_view>

namespace ledge {

class JumpDispatcher {
  public:
    struct JumpResult {
        JumpKind kind = JumpKind::None;
        Velocity2f impulse;
        // Set when a wall jump needs the character turned around
        bool flipFacing = false;
    };

    // Precedence: grounded -> Ground, sliding -> Directed/Plain, else None.
    static JumpKind classify(const ControllerState& state, float horizontal);

    // Execute the jump selected by classify(). Velocity changes go to body
    // immediately; facing changes are returned for the caller to apply.
    JumpResult dispatch(ControllerState& state, const MovementConfig& config, float horizontal,
                        PhysicsBody& body);

    static std::string_view kindToString(JumpKind kind);

  private:
    JumpResult groundJump(ControllerState& state, const MovementConfig& config, PhysicsBody& body);
    JumpResult wallJump(ControllerState& state, const MovementConfig& config, JumpKind kind, float horizontal,
                        PhysicsBody& body);
};

} // namespace ledge
