#pragma once

#include "ledge/core/AnimationPublisher.hh"
#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Collaborators.hh"
#include "ledge/core/GroundContactTracker.hh"
#include "ledge/core/JumpDispatcher.hh"
#include "ledge/core/MovementPhase.hh"
#include "ledge/core/WallJumpLock.hh"
#include "ledge/core/WallSensor.hh"
#include "ledge/core/WallSlide.hh"

#include <span>

namespace ledge {

/**
 * @brief Run/jump/wall-jump controller for one 2D platformer character.
 *
 * The host drives three entry points and owns all scheduling:
 *  - onDecisionTick() once per rendered frame,
 *  - onPhysicsTick() once per fixed physics step,
 *  - onContactBegin() / onContactEnd() between physics steps.
 *
 * A decision tick always runs, in order: wall sensing, wall-slide
 * evaluation, jump dispatch, facing update, wall-jump lock countdown,
 * animation publish. Flipping before the publish is what keeps the run
 * animation from dropping for a frame when the character turns.
 *
 * Not thread-safe. All entry points must be called from the simulation
 * thread.
 */
class PlatformerController {
  public:
    PlatformerController(const MovementConfig& config, PhysicsBody& body, const EnvironmentQuery& environment,
                         AnimationSink* animation = nullptr, VisualTransform* visual = nullptr);

    void onDecisionTick(const FrameInput& input, float dt);
    void onPhysicsTick();
    void onContactBegin(std::span<const ContactPoint> contacts);
    void onContactEnd();

    // Back to spawn state: airborne, facing right, no timers
    void reset();

    void setAnimationSink(AnimationSink* animation);
    void setVisualTransform(VisualTransform* visual);

    const ControllerState& state() const;
    const MovementConfig& config() const;
    MovementPhase phase() const;

    // Jump fired by the most recent decision tick (None if it fired none)
    JumpKind lastJump() const;

    // Horizontal input the physics tick will apply
    float horizontalInput() const;

  private:
    void updateFacing();
    void flip();
    void trackPhase();

    MovementConfig config_;
    PhysicsBody* body_;
    VisualTransform* visual_;

    ControllerState state_;
    float horizontal_ = 0.0f;
    JumpKind lastJump_ = JumpKind::None;
    MovementPhase phase_ = MovementPhase::Airborne;

    WallSensor wallSensor_;
    WallSlideEvaluator wallSlide_;
    JumpDispatcher jumps_;
    GroundContactTracker groundTracker_;
    AnimationPublisher animation_;
};

} // namespace ledge
