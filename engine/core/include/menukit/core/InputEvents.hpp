#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "menukit/core/Types.hpp"

namespace menukit::core {

enum class InputEventType {
    Quit,
    WindowResize,
    KeyDown,
    KeyUp,
    MouseMotion,
    MouseButtonDown,
    MouseButtonUp,
    JoyButtonDown,
    JoyButtonUp,
    JoyAxisMotion,
    JoyHatMotion,
    JoyBallMotion
};

// Key codes are the backend's virtual key values (SDL_Keycode).
using KeyCode = std::int32_t;

enum class MouseButton : std::uint8_t { Left = 1, Middle = 2, Right = 3, X1 = 4, X2 = 5 };

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    Size size{};
    KeyCode key = 0;
    std::string character;
    std::string key_name;
    std::uint16_t modifiers = 0;
    Point position{};
    Point relative{};
    MouseButton mouse_button = MouseButton::Left;
    int joy_id = 0;
    int index = 0;
    float axis_value = 0.0f;
    HatValue hat{};
};

using InputBatch = std::vector<InputEvent>;

}  // namespace menukit::core
