#pragma once

#include "ledge/core/CharacterTypes.hh"

#include <SDL3/SDL.h>

#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace ledge {

enum class InputAction : uint8_t {
    MoveLeft,
    MoveRight,
    Jump
};

// Translates SDL3 keyboard events into per-frame FrameInput samples.
class PlatformerInput {
  public:
    // Binds A/Left, D/Right and Space
    PlatformerInput();

    void bindKey(InputAction action, SDL_Keycode key);
    void unbindKey(SDL_Keycode key);
    void clearBindings();

    // Process a single SDL event. Returns true if consumed.
    bool processEvent(const SDL_Event& event);

    bool isActionActive(InputAction action) const;

    // Sample for this decision tick. Consumes the pending jump edge, so the
    // next sample reports jumpPressed = false until the key goes down again.
    FrameInput sample();

    // Drop held keys and any pending jump (e.g. on focus loss)
    void reset();

    static std::string_view actionToString(InputAction action);

  private:
    void setHeld(InputAction action, bool down);

    std::unordered_map<SDL_Keycode, InputAction> keyBindings_;
    // Keys held per action; two keys bound to one action count separately
    int leftHeld_ = 0;
    int rightHeld_ = 0;
    int jumpHeld_ = 0;
    bool jumpEdge_ = false;
};

} // namespace ledge
