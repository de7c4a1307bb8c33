#include "ledge/core/GroundContactTracker.hh"

#include <algorithm>

namespace ledge {

bool GroundContactTracker::isGroundContact(std::span<const ContactPoint> contacts) {
    return std::any_of(contacts.begin(), contacts.end(),
                       [](const ContactPoint& c) { return c.normal.y >= kGroundNormalThreshold; });
}

bool GroundContactTracker::onContactBegin(ControllerState& state, std::span<const ContactPoint> contacts) {
    if (!isGroundContact(contacts)) {
        return false;
    }

    state.grounded = true;
    state.isJumping = false;
    WallJumpLock::cancel(state);
    return true;
}

void GroundContactTracker::onContactEnd(ControllerState& state) {
    state.grounded = false;
}

} // namespace ledge
