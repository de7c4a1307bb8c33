#include "ledge/core/PlatformerController.hh"
#include "ledge/core/Log.hh"

#include <algorithm>
#include <cmath>

namespace ledge {

PlatformerController::PlatformerController(const MovementConfig& config, PhysicsBody& body,
                                           const EnvironmentQuery& environment, AnimationSink* animation,
                                           VisualTransform* visual)
    : config_(config), body_(&body), visual_(visual), wallSensor_(environment), animation_(animation) {}

void PlatformerController::onDecisionTick(const FrameInput& input, float dt) {
    horizontal_ = std::clamp(input.horizontal, -1.0f, 1.0f);

    // Captured before any flip so a turn does not read as a stop
    state_.isRunning = std::abs(horizontal_) > kRunThreshold;

    bool wasSliding = state_.isWallSliding;
    wallSensor_.update(state_, body_->position(), config_);
    wallSlide_.evaluate(state_, config_, horizontal_, *body_);

    lastJump_ = JumpKind::None;
    if (input.jumpPressed) {
        // Pushing off the wall ends the slide in the same tick the jump is
        // pressed; it still counts as jumping off that wall.
        if (wasSliding && state_.isTouchingWall && !state_.grounded && !state_.isWallJumping) {
            state_.isWallSliding = true;
        }

        auto result = jumps_.dispatch(state_, config_, horizontal_, *body_);
        lastJump_ = result.kind;

        if (result.kind != JumpKind::None) {
            LEDGE_MOVEMENT_DEBUG("Jump dispatched: {} (impulse {:.2f}, {:.2f}, wallDirX {})",
                                 JumpDispatcher::kindToString(result.kind), result.impulse.x, result.impulse.y,
                                 state_.wallDirX);
            animation_.triggerJump();
        }
        if (result.flipFacing) {
            flip();
        }
    }

    updateFacing();

    // A lock armed by this tick's wall jump starts counting next tick
    bool armedThisTick = lastJump_ == JumpKind::Plain || lastJump_ == JumpKind::Directed;
    if (!armedThisTick && WallJumpLock::update(state_, dt)) {
        LEDGE_MOVEMENT_DEBUG("Wall-jump lock expired");
    }

    animation_.publish(state_);
    trackPhase();
}

void PlatformerController::onPhysicsTick() {
    // Leave the wall-jump impulse to gravity and drag
    if (state_.isWallJumping) {
        return;
    }

    if (state_.isWallSliding && horizontal_ * static_cast<float>(state_.facingSign()) < 0.0f) {
        return;
    }

    auto v = body_->velocity();
    body_->setVelocity(Velocity2f(horizontal_ * config_.moveSpeed, v.y));
}

void PlatformerController::onContactBegin(std::span<const ContactPoint> contacts) {
    if (groundTracker_.onContactBegin(state_, contacts)) {
        trackPhase();
    }
}

void PlatformerController::onContactEnd() {
    groundTracker_.onContactEnd(state_);
    trackPhase();
}

void PlatformerController::reset() {
    state_ = ControllerState{};
    horizontal_ = 0.0f;
    lastJump_ = JumpKind::None;
    phase_ = derivePhase(state_);
    if (visual_) {
        visual_->setFacingSign(state_.facingSign());
    }
}

void PlatformerController::setAnimationSink(AnimationSink* animation) {
    animation_.setSink(animation);
}

void PlatformerController::setVisualTransform(VisualTransform* visual) {
    visual_ = visual;
}

const ControllerState& PlatformerController::state() const {
    return state_;
}

const MovementConfig& PlatformerController::config() const {
    return config_;
}

MovementPhase PlatformerController::phase() const {
    return phase_;
}

JumpKind PlatformerController::lastJump() const {
    return lastJump_;
}

float PlatformerController::horizontalInput() const {
    return horizontal_;
}

void PlatformerController::updateFacing() {
    if (WallJumpLock::active(state_)) {
        return;
    }

    if ((horizontal_ > 0.0f && !state_.facingRight) || (horizontal_ < 0.0f && state_.facingRight)) {
        flip();
    }
}

void PlatformerController::flip() {
    bool wasRunning = state_.isRunning;

    state_.facingRight = !state_.facingRight;
    if (visual_) {
        visual_->setFacingSign(state_.facingSign());
    }

    if (wasRunning) {
        animation_.assertRunning();
    }
}

void PlatformerController::trackPhase() {
    MovementPhase next = derivePhase(state_);
    if (next == phase_) {
        return;
    }
    LEDGE_MOVEMENT_DEBUG("Movement phase: {} -> {}", phaseToString(phase_), phaseToString(next));
    phase_ = next;
}

} // namespace ledge
