#include "menukit/ui/Menu.hpp"

#include <utility>

namespace menukit::ui {

MenuConfig MenuConfig::FromApp(const core::AppConfig& app) {
    MenuConfig config;
    config.polling_rate = app.menu_rate;
    config.repeat_delay = app.repeat_delay;
    config.bindings = app.bindings;
    return config;
}

Menu::Menu(Context& context, MenuConfig config)
    : context_(&context), config_(std::move(config)) {
    if (!config_.background_image.empty()) {
        background_image_.emplace(config_.background_image);
    }
}

std::size_t Menu::Add(std::string message, OptionStyle style, Action action) {
    options_.emplace_back(context_->fonts, std::move(message), std::move(style), std::move(action));
    const std::size_t index = ring_.Append();
    layout_dirty_ = true;
    if (!focused_) {
        focused_ = index;
        options_[index].OnFocus();
    }
    return index;
}

bool Menu::Link(std::size_t from, std::size_t to) {
    return ring_.Link(from, to);
}

void Menu::LinkChain(bool wrap) {
    ring_.LinkChain(wrap);
}

void Menu::OnApply(std::size_t index, Handler handler) {
    handlers_[index] = std::move(handler);
}

void Menu::Focus(std::size_t index) {
    if (index >= options_.size() || focused_ == index) {
        return;
    }
    if (focused_) {
        options_[*focused_].OnBlur();
    }
    focused_ = index;
    options_[index].OnFocus();
}

Option* Menu::focused_option() {
    if (!focused_) {
        return nullptr;
    }
    return &options_[*focused_];
}

std::optional<std::size_t> Menu::Find(const std::string& id) const {
    for (std::size_t i = 0; i < options_.size(); ++i) {
        if (options_[i].id() == id) {
            return i;
        }
    }
    return std::nullopt;
}

core::Rect Menu::area() const {
    return config_.area ? *config_.area : context_->display.area();
}

void Menu::Layout() {
    const core::Rect target = area();
    std::vector<core::Size> sizes;
    sizes.reserve(options_.size());
    for (auto& option : options_) {
        sizes.push_back(option.size());
    }
    const auto corners = core::StackCentered(target, sizes, config_.spacing);
    for (std::size_t i = 0; i < options_.size(); ++i) {
        options_[i].set_pos(corners[i]);
    }
    laid_out_area_ = target;
    layout_dirty_ = false;
}

void Menu::EnsureLayout() {
    const core::Rect target = area();
    if (layout_dirty_ || !laid_out_area_ || laid_out_area_->size() != target.size() ||
        laid_out_area_->topleft() != target.topleft()) {
        Layout();
    }
}

void Menu::Draw(SDL_Renderer* renderer) {
    EnsureLayout();
    const core::Rect target = area();
    if (!renderer) {
        return;
    }
    if (config_.background) {
        const core::Color& color = *config_.background;
        SDL_Rect rect{target.x, target.y, target.w, target.h};
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
        SDL_RenderFillRect(renderer, &rect);
    }
    if (background_image_) {
        background_image_->BlitOn(renderer, target);
    }
    for (auto& option : options_) {
        option.Draw(renderer);
    }
}

void Menu::Loop() {
    running_ = true;
    while (context_->display.running() && running_) {
        Iterate();
    }
}

void Menu::Iterate() {
    Context& ctx = *context_;
    const core::InputBatch events = ctx.display.Poll();
    ctx.display.Update(events);
    ctx.keyboard.Update(events);
    ctx.mouse.Update(events);
    if (ctx.joystick) {
        ctx.joystick->Update(events);
    }
    EnsureLayout();

    const int joystick_direction = JoystickDirection();
    const bool previous_pushed =
        PushedAny(config_.bindings.previous, config_.repeat_delay) || joystick_direction < 0;
    const bool next_pushed =
        PushedAny(config_.bindings.next, config_.repeat_delay) || joystick_direction > 0;

    if (previous_pushed && focused_) {
        if (auto target = ring_.previous(*focused_)) {
            Focus(*target);
        }
    }
    if (next_pushed && focused_) {
        if (auto target = ring_.next(*focused_)) {
            Focus(*target);
        }
    }
    if (ctx.mouse.Move()) {
        FocusUnderPointer();
    }

    ctx.display.Clear();
    Draw(ctx.display.renderer());
    ctx.display.Present();
    ctx.display.Throttle(config_.polling_rate);

    const bool confirm_pushed = PushedAny(config_.bindings.confirm, core::kNoRepeat);
    const bool joystick_confirm = JoystickConfirm();
    bool clicked = false;
    if (core::IsPushed(ctx.mouse.Push(core::MouseButton::Left, core::kNoRepeat))) {
        Option* current = focused_option();
        clicked = current && ctx.mouse.Inside(current->area());
    }
    if (confirm_pushed || joystick_confirm || clicked) {
        Apply();
    }
}

bool Menu::PushedAny(const std::vector<std::string>& names, double delay) {
    bool pushed = false;
    // Every binding is queried so that no pending press is left armed.
    for (const auto& name : names) {
        if (core::IsPushed(context_->keyboard.PushName(name, delay))) {
            pushed = true;
        }
    }
    return pushed;
}

int Menu::JoystickDirection() {
    core::Joystick* joystick = context_->joystick;
    if (!joystick) {
        return 0;
    }
    int direction = 0;
    if (core::IsPushed(joystick->PushHat(config_.joystick_hat, config_.repeat_delay))) {
        if (auto hat = joystick->Hat(config_.joystick_hat)) {
            // Hat up is positive y.
            direction = hat->y > 0 ? -1 : (hat->y < 0 ? 1 : 0);
        }
    }
    if (core::IsPushed(joystick->PushAxis(config_.joystick_vertical_axis, config_.repeat_delay))) {
        if (auto value = joystick->Axis(config_.joystick_vertical_axis)) {
            if (*value < -core::kAxisDeadZone) {
                direction = -1;
            } else if (*value > core::kAxisDeadZone) {
                direction = 1;
            }
        }
    }
    return direction;
}

bool Menu::JoystickConfirm() {
    core::Joystick* joystick = context_->joystick;
    if (!joystick) {
        return false;
    }
    return core::IsPushed(joystick->PushButton(config_.joystick_confirm_button, core::kNoRepeat));
}

void Menu::FocusUnderPointer() {
    Option* current = focused_option();
    if (!current || context_->mouse.Inside(current->area())) {
        return;
    }
    for (std::size_t i = 0; i < options_.size(); ++i) {
        if (context_->mouse.Inside(options_[i].area())) {
            Focus(i);
            return;
        }
    }
}

void Menu::Apply() {
    if (!focused_) {
        return;
    }
    const std::size_t index = *focused_;
    auto it = handlers_.find(index);
    if (it != handlers_.end() && it->second) {
        // Copied so that a handler may replace itself.
        Handler handler = it->second;
        handler(*this);
        return;
    }
    options_[index].Apply();
}

}  // namespace menukit::ui
