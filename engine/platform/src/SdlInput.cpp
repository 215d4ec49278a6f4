#include "menukit/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cctype>
#include <optional>

namespace menukit::platform {

namespace {

constexpr const char* kNoJoystickName = "Joystick not detected by SDL.";

// Buttons past X2 have no MouseButton value.
std::optional<core::MouseButton> ToMouseButton(Uint8 button) {
    switch (button) {
        case SDL_BUTTON_LEFT:
            return core::MouseButton::Left;
        case SDL_BUTTON_MIDDLE:
            return core::MouseButton::Middle;
        case SDL_BUTTON_RIGHT:
            return core::MouseButton::Right;
        case SDL_BUTTON_X1:
            return core::MouseButton::X1;
        case SDL_BUTTON_X2:
            return core::MouseButton::X2;
        default:
            return std::nullopt;
    }
}

// Printable character produced by a key press, empty for non-printing keys.
std::string ToCharacter(SDL_Keycode key, Uint16 modifiers) {
    if (key < 32 || key > 126) {
        return {};
    }
    char ch = static_cast<char>(key);
    const bool shift = (modifiers & KMOD_SHIFT) != 0;
    const bool caps = (modifiers & KMOD_CAPS) != 0;
    if (std::isalpha(static_cast<unsigned char>(ch)) && (shift != caps)) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return std::string(1, ch);
}

core::HatValue ToHat(Uint8 value) {
    core::HatValue hat;
    if (value & SDL_HAT_UP) {
        hat.y = 1;
    } else if (value & SDL_HAT_DOWN) {
        hat.y = -1;
    }
    if (value & SDL_HAT_RIGHT) {
        hat.x = 1;
    } else if (value & SDL_HAT_LEFT) {
        hat.x = -1;
    }
    return hat;
}

float ToAxisValue(Sint16 value) {
    return std::clamp(static_cast<float>(value) / 32767.0f, -1.0f, 1.0f);
}

}  // namespace

SdlInput::~SdlInput() {
    Shutdown();
}

bool SdlInput::Initialize() {
    if (initialized_) {
        return true;
    }
    SDL_JoystickEventState(SDL_ENABLE);
    const int joystick_count = SDL_NumJoysticks();
    for (int i = 0; i < joystick_count; ++i) {
        OpenJoystick(i);
    }
    initialized_ = true;
    return true;
}

void SdlInput::Shutdown() {
    for (auto& entry : joysticks_) {
        if (entry.joystick) {
            SDL_JoystickClose(entry.joystick);
            entry.joystick = nullptr;
        }
    }
    joysticks_.clear();
    initialized_ = false;
}

void SdlInput::OpenJoystick(int device_index) {
    SDL_Joystick* joystick = SDL_JoystickOpen(device_index);
    if (!joystick) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to open joystick %d: %s", device_index,
                    SDL_GetError());
        return;
    }
    SDL_JoystickID instance_id = SDL_JoystickInstanceID(joystick);
    auto it = std::find_if(joysticks_.begin(), joysticks_.end(),
                           [&](const JoystickEntry& entry) { return entry.instance_id == instance_id; });
    if (it != joysticks_.end()) {
        SDL_JoystickClose(joystick);
        return;
    }
    joysticks_.push_back(JoystickEntry{instance_id, device_index, joystick});
}

void SdlInput::CloseJoystick(SDL_JoystickID instance_id) {
    auto it = std::find_if(joysticks_.begin(), joysticks_.end(),
                           [&](const JoystickEntry& entry) { return entry.instance_id == instance_id; });
    if (it == joysticks_.end()) {
        return;
    }
    if (it->joystick) {
        SDL_JoystickClose(it->joystick);
    }
    joysticks_.erase(it);
}

int SdlInput::DeviceIndex(SDL_JoystickID instance_id) const {
    auto it = std::find_if(joysticks_.begin(), joysticks_.end(),
                           [&](const JoystickEntry& entry) { return entry.instance_id == instance_id; });
    if (it == joysticks_.end()) {
        return -1;
    }
    return it->device_index;
}

std::string SdlInput::JoystickName(int device_index) const {
    auto it = std::find_if(joysticks_.begin(), joysticks_.end(),
                           [&](const JoystickEntry& entry) { return entry.device_index == device_index; });
    if (it == joysticks_.end() || !it->joystick) {
        return kNoJoystickName;
    }
    const char* name = SDL_JoystickName(it->joystick);
    return name ? name : kNoJoystickName;
}

void SdlInput::SetCursorVisible(bool visible) {
    SDL_ShowCursor(visible ? SDL_ENABLE : SDL_DISABLE);
}

void SdlInput::WarpCursor(SDL_Window* window, const core::Point& pos) {
    SDL_WarpMouseInWindow(window, pos.x, pos.y);
}

core::InputBatch SdlInput::Poll() {
    core::InputBatch events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        core::InputEvent evt;
        switch (sdl_event.type) {
            case SDL_QUIT:
                evt.type = core::InputEventType::Quit;
                events.push_back(evt);
                break;
            case SDL_WINDOWEVENT:
                if (sdl_event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    evt.type = core::InputEventType::WindowResize;
                    evt.size = core::Size{sdl_event.window.data1, sdl_event.window.data2};
                    events.push_back(evt);
                }
                break;
            case SDL_KEYDOWN: {
                // Typematic repeats are produced by InputChannel, not the OS.
                if (sdl_event.key.repeat != 0) {
                    break;
                }
                const SDL_Keysym& keysym = sdl_event.key.keysym;
                evt.type = core::InputEventType::KeyDown;
                evt.key = keysym.sym;
                evt.modifiers = keysym.mod;
                evt.character = ToCharacter(keysym.sym, keysym.mod);
                evt.key_name = SDL_GetKeyName(keysym.sym);
                events.push_back(evt);
                break;
            }
            case SDL_KEYUP: {
                const SDL_Keysym& keysym = sdl_event.key.keysym;
                evt.type = core::InputEventType::KeyUp;
                evt.key = keysym.sym;
                evt.modifiers = keysym.mod;
                evt.key_name = SDL_GetKeyName(keysym.sym);
                events.push_back(evt);
                break;
            }
            case SDL_MOUSEMOTION:
                evt.type = core::InputEventType::MouseMotion;
                evt.position = core::Point{sdl_event.motion.x, sdl_event.motion.y};
                evt.relative = core::Point{sdl_event.motion.xrel, sdl_event.motion.yrel};
                events.push_back(evt);
                break;
            case SDL_MOUSEBUTTONDOWN: {
                const auto button = ToMouseButton(sdl_event.button.button);
                if (!button) {
                    break;
                }
                evt.type = core::InputEventType::MouseButtonDown;
                evt.position = core::Point{sdl_event.button.x, sdl_event.button.y};
                evt.mouse_button = *button;
                events.push_back(evt);
                break;
            }
            case SDL_MOUSEBUTTONUP: {
                const auto button = ToMouseButton(sdl_event.button.button);
                if (!button) {
                    break;
                }
                evt.type = core::InputEventType::MouseButtonUp;
                evt.position = core::Point{sdl_event.button.x, sdl_event.button.y};
                evt.mouse_button = *button;
                events.push_back(evt);
                break;
            }
            case SDL_JOYBUTTONDOWN:
                evt.type = core::InputEventType::JoyButtonDown;
                evt.joy_id = DeviceIndex(sdl_event.jbutton.which);
                evt.index = sdl_event.jbutton.button;
                events.push_back(evt);
                break;
            case SDL_JOYBUTTONUP:
                evt.type = core::InputEventType::JoyButtonUp;
                evt.joy_id = DeviceIndex(sdl_event.jbutton.which);
                evt.index = sdl_event.jbutton.button;
                events.push_back(evt);
                break;
            case SDL_JOYAXISMOTION:
                evt.type = core::InputEventType::JoyAxisMotion;
                evt.joy_id = DeviceIndex(sdl_event.jaxis.which);
                evt.index = sdl_event.jaxis.axis;
                evt.axis_value = ToAxisValue(sdl_event.jaxis.value);
                events.push_back(evt);
                break;
            case SDL_JOYHATMOTION:
                evt.type = core::InputEventType::JoyHatMotion;
                evt.joy_id = DeviceIndex(sdl_event.jhat.which);
                evt.index = sdl_event.jhat.hat;
                evt.hat = ToHat(sdl_event.jhat.value);
                events.push_back(evt);
                break;
            case SDL_JOYBALLMOTION:
                evt.type = core::InputEventType::JoyBallMotion;
                evt.joy_id = DeviceIndex(sdl_event.jball.which);
                evt.index = sdl_event.jball.ball;
                evt.relative = core::Point{sdl_event.jball.xrel, sdl_event.jball.yrel};
                events.push_back(evt);
                break;
            case SDL_JOYDEVICEADDED:
                OpenJoystick(sdl_event.jdevice.which);
                break;
            case SDL_JOYDEVICEREMOVED:
                CloseJoystick(sdl_event.jdevice.which);
                break;
            default:
                break;
        }
    }
    return events;
}

}  // namespace menukit::platform
