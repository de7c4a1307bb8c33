#include "ledge/core/WallJumpLock.hh"

namespace ledge {

void WallJumpLock::start(ControllerState& state, const MovementConfig& config) {
    state.wallJumpCounter = config.wallJumpTime;
    state.isWallJumping = state.wallJumpCounter > 0.0f;
    if (!state.isWallJumping) {
        state.wallJumpCounter = 0.0f;
    }
}

bool WallJumpLock::update(ControllerState& state, float dt) {
    if (!state.isWallJumping) {
        return false;
    }

    state.wallJumpCounter -= dt;
    if (state.wallJumpCounter <= 0.0f) {
        state.wallJumpCounter = 0.0f;
        state.isWallJumping = false;
        return true;
    }
    return false;
}

void WallJumpLock::cancel(ControllerState& state) {
    state.isWallJumping = false;
    state.wallJumpCounter = 0.0f;
}

bool WallJumpLock::active(const ControllerState& state) {
    return state.isWallJumping;
}

} // namespace ledge
