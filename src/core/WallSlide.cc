#include "ledge/core/WallSlide.hh"

#include <algorithm>

namespace ledge {

bool WallSlideEvaluator::shouldSlide(const ControllerState& state, float horizontal) {
    if (!state.isTouchingWall || state.grounded) {
        return false;
    }

    int inputDir = signOf(horizontal);
    bool pushingIntoWall = inputDir != 0 && inputDir == state.wallDirX;
    bool noHorizontalInput = inputDir == 0;
    return pushingIntoWall || noHorizontalInput;
}

bool WallSlideEvaluator::evaluate(ControllerState& state, const MovementConfig& config, float horizontal,
                                  PhysicsBody& body) const {
    // Never interfere with a wall-jump trajectory
    if (state.isWallJumping) {
        state.isWallSliding = false;
        return false;
    }

    state.isWallSliding = shouldSlide(state, horizontal);

    if (state.isWallSliding) {
        auto v = body.velocity();
        float capped = std::max(v.y, -config.wallSlideSpeed);
        if (capped != v.y) {
            body.setVelocity(Velocity2f(v.x, capped));
        }
    }

    return state.isWallSliding;
}

} // namespace ledge
