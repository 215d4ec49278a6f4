#include "menukit/ui/Option.hpp"

#include <algorithm>
#include <utility>

namespace menukit::ui {

namespace {

render::TextStyle BlurredTextStyle(const OptionStyle& style) {
    render::TextStyle text_style;
    text_style.font_file = style.font_file;
    text_style.font_size = style.font_size;
    text_style.antialias = style.antialias;
    text_style.message_color = style.message_color_onblur;
    text_style.background_color = style.background_color_onblur;
    return text_style;
}

}  // namespace

Option::Option(render::FontCache& fonts,
               std::string message,
               OptionStyle style,
               Action action,
               const core::Point& pos)
    : id_(message),
      style_(std::move(style)),
      text_(fonts, std::move(message), BlurredTextStyle(style_), pos),
      action_(std::move(action)) {}

void Option::OnFocus() {
    focused_ = true;
    text_.set_message_color(style_.message_color_onfocus);
    text_.set_background_color(style_.background_color_onfocus);
    if (focus_listener_) {
        focus_listener_(true);
    }
}

void Option::OnBlur() {
    focused_ = false;
    text_.set_message_color(style_.message_color_onblur);
    text_.set_background_color(style_.background_color_onblur);
    if (focus_listener_) {
        focus_listener_(false);
    }
}

bool Option::has_action() const noexcept {
    const auto* callback = std::get_if<std::function<void()>>(&action_);
    return callback && static_cast<bool>(*callback);
}

void Option::Apply() {
    if (auto* callback = std::get_if<std::function<void()>>(&action_); callback && *callback) {
        (*callback)();
        return;
    }
    SDL_Log("%s", text_.message().c_str());
}

core::Rect Option::area() {
    core::Rect rect = text_.area();
    rect.w = std::max(rect.w, style_.min_size.w);
    rect.h = std::max(rect.h, style_.min_size.h);
    return rect;
}

void Option::Draw(SDL_Renderer* renderer) {
    text_.BlitOn(renderer);
}

}  // namespace menukit::ui
