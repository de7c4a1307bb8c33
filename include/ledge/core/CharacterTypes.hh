#pragma once

#include "ledge/core/Spatial.hh"

#include <cstdint>

namespace ledge {

// Bit set of collision layers. Bit N selects layer N of the host's physics
// engine; the controller treats it as opaque and only forwards it to probes.
using LayerMask = uint32_t;

constexpr LayerMask layerBit(uint32_t layer) {
    return LayerMask{1} << layer;
}

// Contact normals with an up-component at or above this count as ground.
inline constexpr float kGroundNormalThreshold = 0.5f;

// Horizontal input magnitude above which the character counts as running.
inline constexpr float kRunThreshold = 0.1f;

struct MovementConfig {
    float moveSpeed = 8.0f;
    float jumpForce = 14.0f;
    float wallJumpForce = 10.0f;
    float directedWallJumpForce = 12.0f;
    float wallSlideSpeed = 2.0f;
    float wallCheckDistance = 0.6f;
    float wallJumpTime = 0.2f;
    LayerMask wallLayer = layerBit(1);
};

// One decision tick worth of input. jumpPressed is an edge: true only on the
// frame the button went down.
struct FrameInput {
    float horizontal = 0.0f;
    bool jumpPressed = false;
};

struct ControllerState {
    bool facingRight = true;
    bool grounded = false;
    bool isRunning = false;

    bool isTouchingWall = false;
    int wallDirX = 0;
    bool isWallSliding = false;

    // isWallJumping <=> wallJumpCounter > 0 at every tick boundary
    bool isWallJumping = false;
    float wallJumpCounter = 0.0f;

    bool isJumping = false;

    int facingSign() const { return facingRight ? 1 : -1; }
};

enum class JumpKind : uint8_t {
    None,
    Ground,
    Plain,
    Directed
};

// A single contact point reported by the physics engine. The normal points
// from the other surface towards the character.
struct ContactPoint {
    Vec2f point;
    Vec2f normal;
};

} // namespace ledge
