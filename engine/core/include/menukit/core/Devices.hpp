#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "menukit/core/InputChannel.hpp"
#include "menukit/core/InputEvents.hpp"
#include "menukit/core/Types.hpp"

namespace menukit::core {

class Keyboard {
public:
    explicit Keyboard(TimeSource now = SteadyTimeSource());

    void Update(const InputBatch& events);

    PushState Push(KeyCode key, double delay = 0.0);
    // Same query, with the key found by the character it last produced.
    PushState PushCharacter(const std::string& character, double delay = 0.0);
    // Same query, with the key found by its symbolic name ("up", "return").
    PushState PushName(const std::string& name, double delay = 0.0);

    bool Held(KeyCode key) const { return keys_.held(key); }

    std::optional<KeyCode> ResolveCharacter(const std::string& character) const;
    std::optional<KeyCode> ResolveName(const std::string& name) const;

private:
    TimeSource now_;
    InputChannel<KeyCode> keys_;
    std::unordered_map<std::string, KeyCode> characters_;
    std::unordered_map<std::string, KeyCode> names_;
};

struct MouseButtonHash {
    std::size_t operator()(MouseButton button) const noexcept {
        return static_cast<std::size_t>(button);
    }
};

class Mouse {
public:
    explicit Mouse(TimeSource now = SteadyTimeSource());

    void Update(const InputBatch& events);

    PushState Push(MouseButton button, double delay = 0.0);

    const Point& pos() const noexcept { return pos_; }
    int xpos() const noexcept { return pos_.x; }
    int ypos() const noexcept { return pos_.y; }

    // Motion accumulated over the last batch.
    const Point& rel() const noexcept { return rel_; }
    int xrel() const noexcept { return rel_.x; }
    int yrel() const noexcept { return rel_.y; }

    bool Move() const noexcept { return rel_.x != 0 || rel_.y != 0; }
    bool Inside(const Rect& area) const noexcept { return core::Inside(area, pos_); }

private:
    TimeSource now_;
    Point pos_{};
    Point rel_{};
    InputChannel<MouseButton, MouseButtonHash> buttons_;
};

// Axis values within this distance of zero count as released.
inline constexpr float kAxisDeadZone = 0.1f;

class Joystick {
public:
    explicit Joystick(int id = 0, TimeSource now = SteadyTimeSource());

    void Update(const InputBatch& events);

    int id() const noexcept { return id_; }

    PushState PushButton(int button, double delay = 0.0);
    PushState PushAxis(int axis, double delay = 0.0);
    PushState PushHat(int hat, double delay = 0.0);

    std::optional<float> Axis(int axis) const;
    std::optional<HatValue> Hat(int hat) const;
    std::optional<Point> Ball(int ball) const;

private:
    int id_ = 0;
    TimeSource now_;
    InputChannel<int> buttons_;
    InputChannel<int> axes_;
    InputChannel<int> hats_;
    std::unordered_map<int, float> axis_values_;
    std::unordered_map<int, HatValue> hat_values_;
    std::unordered_map<int, Point> ball_values_;
};

}  // namespace menukit::core
