#pragma once

#include <SDL2/SDL.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "menukit/core/AppConfig.hpp"
#include "menukit/core/Navigation.hpp"
#include "menukit/core/Types.hpp"
#include "menukit/render/Sprite.hpp"
#include "menukit/ui/Context.hpp"
#include "menukit/ui/Option.hpp"

namespace menukit::ui {

struct MenuConfig {
    int polling_rate = core::kDefaultMenuRate;
    double repeat_delay = core::kDefaultRepeatDelay;
    core::MenuBindings bindings{};
    int joystick_confirm_button = 0;
    int joystick_vertical_axis = 1;
    int joystick_hat = 0;
    int spacing = 0;
    // The whole display when unset.
    std::optional<core::Rect> area;
    std::optional<core::Color> background;
    std::string background_image;

    static MenuConfig FromApp(const core::AppConfig& app);
};

class Menu;

using Handler = std::function<void(Menu&)>;

// An ordered, owned list of options with previous/next links between them and
// a blocking interaction loop. The first option added gets the focus; from
// then on exactly one option is focused.
class Menu {
public:
    explicit Menu(Context& context, MenuConfig config = {});

    Menu(Menu&&) = default;
    Menu(const Menu&) = delete;
    Menu& operator=(const Menu&) = delete;

    std::size_t Add(std::string message, OptionStyle style = {}, Action action = {});

    // Sets from.next = to and to.previous = from in one step.
    bool Link(std::size_t from, std::size_t to);
    // Links options in list order; `wrap` also links the last to the first.
    void LinkChain(bool wrap);

    // Replaces Option::Apply for one option.
    void OnApply(std::size_t index, Handler handler);

    void Focus(std::size_t index);
    std::optional<std::size_t> focused() const noexcept { return focused_; }
    Option* focused_option();

    std::optional<std::size_t> previous(std::size_t index) const { return ring_.previous(index); }
    std::optional<std::size_t> next(std::size_t index) const { return ring_.next(index); }

    std::optional<std::size_t> Find(const std::string& id) const;
    Option& option(std::size_t index) { return options_.at(index); }
    std::size_t size() const noexcept { return options_.size(); }
    bool empty() const noexcept { return options_.empty(); }

    // Runs until the application or this menu stops running. Reopens a
    // closed menu.
    void Loop();
    void Apply();

    bool running() const noexcept { return running_; }
    void set_running(bool value) noexcept { running_ = value; }
    void Close() noexcept { running_ = false; }

    core::Rect area() const;
    void Layout();
    void Draw(SDL_Renderer* renderer);

    Context& context() noexcept { return *context_; }
    const MenuConfig& config() const noexcept { return config_; }

private:
    void Iterate();
    void EnsureLayout();
    bool PushedAny(const std::vector<std::string>& names, double delay);
    // -1 for previous, 1 for next, 0 when the joystick asks for nothing.
    int JoystickDirection();
    bool JoystickConfirm();
    void FocusUnderPointer();

    Context* context_;
    MenuConfig config_;
    std::vector<Option> options_;
    core::NavigationRing ring_;
    std::unordered_map<std::size_t, Handler> handlers_;
    std::optional<std::size_t> focused_;
    std::optional<render::ImageSprite> background_image_;
    std::optional<core::Rect> laid_out_area_;
    bool layout_dirty_ = true;
    bool running_ = true;
};

}  // namespace menukit::ui
