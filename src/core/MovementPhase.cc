#include "ledge/core/MovementPhase.hh"

namespace ledge {

std::string phaseToString(MovementPhase phase) {
    switch (phase) {
        case MovementPhase::Grounded:    return "Grounded";
        case MovementPhase::Airborne:    return "Airborne";
        case MovementPhase::WallSliding: return "WallSliding";
        case MovementPhase::WallJumping: return "WallJumping";
        default:                         return "Unknown";
    }
}

MovementPhase derivePhase(const ControllerState& state) {
    if (state.isWallJumping)
        return MovementPhase::WallJumping;
    if (state.grounded)
        return MovementPhase::Grounded;
    if (state.isWallSliding)
        return MovementPhase::WallSliding;
    return MovementPhase::Airborne;
}

} // namespace ledge
