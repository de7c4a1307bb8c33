#include "ledge/core/PlatformerInput.hh"
#include "ledge/core/Log.hh"

#include <algorithm>

namespace ledge {

PlatformerInput::PlatformerInput() {
    bindKey(InputAction::MoveLeft, SDLK_A);
    bindKey(InputAction::MoveLeft, SDLK_LEFT);
    bindKey(InputAction::MoveRight, SDLK_D);
    bindKey(InputAction::MoveRight, SDLK_RIGHT);
    bindKey(InputAction::Jump, SDLK_SPACE);
}

std::string_view PlatformerInput::actionToString(InputAction action) {
    switch (action) {
        case InputAction::MoveLeft:  return "MoveLeft";
        case InputAction::MoveRight: return "MoveRight";
        case InputAction::Jump:      return "Jump";
        default:                     return "Unknown";
    }
}

void PlatformerInput::bindKey(InputAction action, SDL_Keycode key) {
    keyBindings_[key] = action;
}

void PlatformerInput::unbindKey(SDL_Keycode key) {
    keyBindings_.erase(key);
}

void PlatformerInput::clearBindings() {
    keyBindings_.clear();
    reset();
}

bool PlatformerInput::processEvent(const SDL_Event& event) {
    switch (event.type) {
        case SDL_EVENT_KEY_DOWN: {
            if (event.key.repeat)
                return false;

            auto it = keyBindings_.find(event.key.key);
            if (it == keyBindings_.end())
                return false;

            setHeld(it->second, true);
            return true;
        }

        case SDL_EVENT_KEY_UP: {
            auto it = keyBindings_.find(event.key.key);
            if (it == keyBindings_.end())
                return false;

            setHeld(it->second, false);
            return true;
        }

        default:
            return false;
    }
}

void PlatformerInput::setHeld(InputAction action, bool down) {
    int delta = down ? 1 : -1;
    switch (action) {
        case InputAction::MoveLeft:
            leftHeld_ = std::max(0, leftHeld_ + delta);
            break;
        case InputAction::MoveRight:
            rightHeld_ = std::max(0, rightHeld_ + delta);
            break;
        case InputAction::Jump:
            if (down && jumpHeld_ == 0) {
                jumpEdge_ = true;
            }
            jumpHeld_ = std::max(0, jumpHeld_ + delta);
            break;
    }
    LEDGE_LOG_TRACE("Input {} {}", actionToString(action), down ? "down" : "up");
}

bool PlatformerInput::isActionActive(InputAction action) const {
    switch (action) {
        case InputAction::MoveLeft:  return leftHeld_ > 0;
        case InputAction::MoveRight: return rightHeld_ > 0;
        case InputAction::Jump:      return jumpHeld_ > 0;
        default:                     return false;
    }
}

FrameInput PlatformerInput::sample() {
    FrameInput input;
    // Left and right together cancel out
    if (rightHeld_ > 0)
        input.horizontal += 1.0f;
    if (leftHeld_ > 0)
        input.horizontal -= 1.0f;

    input.jumpPressed = jumpEdge_;
    jumpEdge_ = false;
    return input;
}

void PlatformerInput::reset() {
    leftHeld_ = 0;
    rightHeld_ = 0;
    jumpHeld_ = 0;
    jumpEdge_ = false;
}

} // namespace ledge
