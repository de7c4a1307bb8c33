#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/core/WallJumpLock.hh"

#include <span>

namespace ledge {

// Turns physics contact events into the grounded flag.
class GroundContactTracker {
  public:
    static bool isGroundContact(std::span<const ContactPoint> contacts);

    // Returns true if the contact grounded the character. Landing clears
    // isJumping and any in-flight wall-jump lock.
    bool onContactBegin(ControllerState& state, std::span<const ContactPoint> contacts);

    // Any contact loss ungrounds. A continued ground contact is re-asserted
    // by the next contact-begin from the engine.
    void onContactEnd(ControllerState& state);
};

} // namespace ledge
