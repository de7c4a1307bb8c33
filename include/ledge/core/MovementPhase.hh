#pragma once

#include "ledge/core/CharacterTypes.hh"

#include <cstdint>
#include <string>

namespace ledge {

// Coarse phase derived from ControllerState flags. Diagnostic only; the
// controller's behaviour is driven by the flags themselves.
enum class MovementPhase : uint8_t {
    Grounded,
    Airborne,
    WallSliding,
    WallJumping
};

// Precedence: WallJumping > Grounded > WallSliding > Airborne
MovementPhase derivePhase(const ControllerState& state);

std::string phaseToString(MovementPhase phase);

} // namespace ledge
