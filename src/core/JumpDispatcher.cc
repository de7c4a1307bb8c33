#include "ledge/core/JumpDispatcher.hh"

namespace ledge {

std::string_view JumpDispatcher::kindToString(JumpKind kind) {
    switch (kind) {
        case JumpKind::None:     return "None";
        case JumpKind::Ground:   return "Ground";
        case JumpKind::Plain:    return "Plain";
        case JumpKind::Directed: return "Directed";
        default:                 return "Unknown";
    }
}

JumpKind JumpDispatcher::classify(const ControllerState& state, float horizontal) {
    if (state.grounded) {
        return JumpKind::Ground;
    }
    if (!state.isWallSliding) {
        return JumpKind::None;
    }

    int inputDir = signOf(horizontal);
    if (inputDir != 0 && inputDir == -state.wallDirX) {
        return JumpKind::Directed;
    }
    return JumpKind::Plain;
}

JumpDispatcher::JumpResult JumpDispatcher::dispatch(ControllerState& state, const MovementConfig& config,
                                                    float horizontal, PhysicsBody& body) {
    JumpKind kind = classify(state, horizontal);
    switch (kind) {
        case JumpKind::Ground:
            return groundJump(state, config, body);
        case JumpKind::Plain:
        case JumpKind::Directed:
            return wallJump(state, config, kind, horizontal, body);
        case JumpKind::None:
            break;
    }
    return JumpResult{};
}

JumpDispatcher::JumpResult JumpDispatcher::groundJump(ControllerState& state, const MovementConfig& config,
                                                      PhysicsBody& body) {
    auto v = body.velocity();
    body.setVelocity(Velocity2f(v.x, config.jumpForce));

    state.isJumping = true;
    state.grounded = false;

    JumpResult result;
    result.kind = JumpKind::Ground;
    return result;
}

JumpDispatcher::JumpResult JumpDispatcher::wallJump(ControllerState& state, const MovementConfig& config,
                                                    JumpKind kind, float horizontal, PhysicsBody& body) {
    JumpResult result;
    result.kind = kind;

    if (kind == JumpKind::Directed) {
        result.impulse = Velocity2f(horizontal * config.directedWallJumpForce, config.jumpForce);
        // Turn towards the input direction
        result.flipFacing = (horizontal > 0.0f && !state.facingRight) || (horizontal < 0.0f && state.facingRight);
    } else {
        result.impulse = Velocity2f(-static_cast<float>(state.wallDirX) * config.wallJumpForce, config.jumpForce);
        // Turn away from the wall
        result.flipFacing = (state.wallDirX > 0 && state.facingRight) || (state.wallDirX < 0 && !state.facingRight);
    }

    // Same arc regardless of the velocity carried into the wall
    body.setVelocity(Velocity2f(0.0f, 0.0f));
    body.applyImpulse(result.impulse);

    state.isWallSliding = false;
    state.isJumping = true;
    WallJumpLock::start(state, config);

    return result;
}

} // namespace ledge
