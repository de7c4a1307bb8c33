#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/Collaborators.hh"

#include <string_view>

namespace ledge {

namespace anim {
inline constexpr std::string_view kRun = "Run";
inline constexpr std::string_view kGrounded = "grounded";
inline constexpr std::string_view kWallSlide = "wallSlide";
inline constexpr std::string_view kJump = "jump";
} // namespace anim

// Maps controller state onto named animator parameters. Every call is a
// no-op while no sink is attached.
class AnimationPublisher {
  public:
    AnimationPublisher() = default;
    explicit AnimationPublisher(AnimationSink* sink);

    void setSink(AnimationSink* sink);
    bool hasSink() const;

    // Run, grounded and wallSlide booleans (once per decision tick)
    void publish(const ControllerState& state);

    // Edge-triggered jump signal
    void triggerJump();

    // Keep the run animation alive across a flip
    void assertRunning();

  private:
    AnimationSink* sink_ = nullptr;
};

} // namespace ledge
