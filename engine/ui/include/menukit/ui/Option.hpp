#pragma once

#include <SDL2/SDL.h>

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "menukit/core/Types.hpp"
#include "menukit/render/FontCache.hpp"
#include "menukit/render/Text.hpp"

namespace menukit::ui {

using Action = std::variant<std::monostate, std::function<void()>>;

struct OptionStyle {
    std::string font_file;
    int font_size = 84;
    bool antialias = true;
    core::Color message_color_onblur{0, 0, 0, 255};
    core::Color message_color_onfocus{255, 0, 0, 255};
    std::optional<core::Color> background_color_onblur;
    std::optional<core::Color> background_color_onfocus;
    // Smallest hit box, whatever the rendered text size.
    core::Size min_size{};
};

class Option {
public:
    Option(render::FontCache& fonts,
           std::string message = "OPTION",
           OptionStyle style = {},
           Action action = {},
           const core::Point& pos = {});

    void OnFocus();
    void OnBlur();
    bool focused() const noexcept { return focused_; }

    // Runs the action; without one, logs the message instead.
    void Apply();

    const Action& action() const noexcept { return action_; }
    void set_action(Action action) { action_ = std::move(action); }
    bool has_action() const noexcept;

    // Observes every OnFocus (true) and OnBlur (false) call.
    void set_focus_listener(std::function<void(bool)> listener) {
        focus_listener_ = std::move(listener);
    }

    const std::string& id() const noexcept { return id_; }
    void set_id(std::string id) { id_ = std::move(id); }

    const std::string& message() const noexcept { return text_.message(); }
    void set_message(const std::string& value) { text_.set_message(value); }

    const OptionStyle& style() const noexcept { return style_; }

    const core::Point& pos() const noexcept { return text_.pos(); }
    void set_pos(const core::Point& value) { text_.set_pos(value); }

    // Text area grown to the minimum hit box.
    core::Rect area();
    core::Size size() { return area().size(); }

    void Draw(SDL_Renderer* renderer);

    render::Text& text() noexcept { return text_; }
    const render::Text& text() const noexcept { return text_; }

private:
    std::string id_;
    OptionStyle style_;
    render::Text text_;
    Action action_;
    std::function<void(bool)> focus_listener_;
    bool focused_ = false;
};

}  // namespace menukit::ui
