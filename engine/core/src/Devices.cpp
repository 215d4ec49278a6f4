#include "menukit/core/Devices.hpp"

#include <chrono>
#include <cmath>
#include <utility>

namespace menukit::core {

TimeSource SteadyTimeSource() {
    return [] {
        using Seconds = std::chrono::duration<double>;
        return std::chrono::duration_cast<Seconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
            .count();
    };
}

Keyboard::Keyboard(TimeSource now) : now_(std::move(now)) {}

void Keyboard::Update(const InputBatch& events) {
    for (const auto& evt : events) {
        switch (evt.type) {
            case InputEventType::KeyDown:
                keys_.Press(evt.key);
                if (!evt.character.empty()) {
                    characters_[evt.character] = evt.key;
                }
                if (!evt.key_name.empty()) {
                    names_[evt.key_name] = evt.key;
                }
                break;
            case InputEventType::KeyUp:
                keys_.Release(evt.key);
                if (!evt.key_name.empty()) {
                    names_[evt.key_name] = evt.key;
                }
                break;
            default:
                break;
        }
    }
}

PushState Keyboard::Push(KeyCode key, double delay) {
    return keys_.Push(key, delay, now_());
}

PushState Keyboard::PushCharacter(const std::string& character, double delay) {
    auto key = ResolveCharacter(character);
    if (!key) {
        return PushState::Unknown;
    }
    return Push(*key, delay);
}

PushState Keyboard::PushName(const std::string& name, double delay) {
    auto key = ResolveName(name);
    if (!key) {
        return PushState::Unknown;
    }
    return Push(*key, delay);
}

std::optional<KeyCode> Keyboard::ResolveCharacter(const std::string& character) const {
    auto it = characters_.find(character);
    if (it == characters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<KeyCode> Keyboard::ResolveName(const std::string& name) const {
    auto it = names_.find(name);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Mouse::Mouse(TimeSource now) : now_(std::move(now)) {}

void Mouse::Update(const InputBatch& events) {
    rel_ = Point{};
    for (const auto& evt : events) {
        switch (evt.type) {
            case InputEventType::MouseButtonDown:
                buttons_.Press(evt.mouse_button);
                break;
            case InputEventType::MouseButtonUp:
                buttons_.Release(evt.mouse_button);
                break;
            case InputEventType::MouseMotion:
                pos_ = evt.position;
                rel_.x += evt.relative.x;
                rel_.y += evt.relative.y;
                break;
            default:
                break;
        }
    }
}

PushState Mouse::Push(MouseButton button, double delay) {
    return buttons_.Push(button, delay, now_());
}

Joystick::Joystick(int id, TimeSource now) : id_(id), now_(std::move(now)) {}

void Joystick::Update(const InputBatch& events) {
    for (const auto& evt : events) {
        if (evt.joy_id != id_) {
            continue;
        }
        switch (evt.type) {
            case InputEventType::JoyButtonDown:
                buttons_.Press(evt.index);
                break;
            case InputEventType::JoyButtonUp:
                buttons_.Release(evt.index);
                break;
            case InputEventType::JoyAxisMotion:
                axis_values_[evt.index] = evt.axis_value;
                if (std::fabs(evt.axis_value) <= kAxisDeadZone) {
                    axes_.Release(evt.index);
                } else {
                    axes_.Press(evt.index);
                }
                break;
            case InputEventType::JoyHatMotion:
                hat_values_[evt.index] = evt.hat;
                if (evt.hat.neutral()) {
                    hats_.Release(evt.index);
                } else {
                    hats_.Press(evt.index);
                }
                break;
            case InputEventType::JoyBallMotion:
                ball_values_[evt.index] = evt.relative;
                break;
            default:
                break;
        }
    }
}

PushState Joystick::PushButton(int button, double delay) {
    return buttons_.Push(button, delay, now_());
}

PushState Joystick::PushAxis(int axis, double delay) {
    return axes_.Push(axis, delay, now_());
}

PushState Joystick::PushHat(int hat, double delay) {
    return hats_.Push(hat, delay, now_());
}

std::optional<float> Joystick::Axis(int axis) const {
    auto it = axis_values_.find(axis);
    if (it == axis_values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<HatValue> Joystick::Hat(int hat) const {
    auto it = hat_values_.find(hat);
    if (it == hat_values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Point> Joystick::Ball(int ball) const {
    auto it = ball_values_.find(ball);
    if (it == ball_values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace menukit::core
