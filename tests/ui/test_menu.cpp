#include <SDL2/SDL.h>

#include <cassert>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "menukit/core/Devices.hpp"
#include "menukit/core/InputEvents.hpp"
#include "menukit/core/MenuSpec.hpp"
#include "menukit/platform/DisplayBackend.hpp"
#include "menukit/render/FontCache.hpp"
#include "menukit/ui/Context.hpp"
#include "menukit/ui/Menu.hpp"
#include "menukit/ui/MenuBuilder.hpp"
#include "menukit/ui/Option.hpp"

using namespace menukit;
using core::InputBatch;
using core::InputEvent;
using core::InputEventType;
using ui::Menu;
using ui::Option;
using ui::OptionStyle;

namespace {

// Replays prepared event batches; stops the application once they run out.
// Throttling advances the shared manual clock instead of sleeping.
class ScriptedDisplay : public platform::DisplayBackend {
public:
    ScriptedDisplay(double& now, std::vector<InputBatch> script)
        : now_(now), script_(std::move(script)) {}

    InputBatch Poll() override {
        ++polls;
        if (cursor_ >= script_.size()) {
            running_ = false;
            return {};
        }
        return script_[cursor_++];
    }

    void Update(const InputBatch& events) override {
        for (const auto& evt : events) {
            if (evt.type == InputEventType::Quit) {
                running_ = false;
            }
        }
    }

    bool running() const override { return running_; }
    void set_running(bool running) override { running_ = running; }

    core::Rect area() const override { return core::Rect{0, 0, 800, 600}; }
    SDL_Renderer* renderer() const override { return nullptr; }

    void Clear() override {}
    void Present() override { ++presents; }
    void Throttle(int rate) override { now_ += 1.0 / rate; }

    void Reset(std::vector<InputBatch> script) {
        script_ = std::move(script);
        cursor_ = 0;
        running_ = true;
    }

    int polls = 0;
    int presents = 0;

private:
    double& now_;
    std::vector<InputBatch> script_;
    std::size_t cursor_ = 0;
    bool running_ = true;
};

struct Harness {
    explicit Harness(std::vector<InputBatch> script = {}, bool with_joystick = false)
        : display(now, std::move(script)),
          keyboard([this] { return now; }),
          mouse([this] { return now; }),
          joystick(0, [this] { return now; }),
          ctx{display, keyboard, mouse, fonts, with_joystick ? &joystick : nullptr} {}

    double now = 0.0;
    ScriptedDisplay display;
    core::Keyboard keyboard;
    core::Mouse mouse;
    core::Joystick joystick;
    render::FontCache fonts;
    ui::Context ctx;
};

struct FocusLog {
    std::vector<std::string> entries;

    void Watch(Option& option) {
        const std::string name = option.message();
        option.set_focus_listener([this, name](bool focused) {
            entries.push_back((focused ? "focus " : "blur ") + name);
        });
    }
};

InputEvent Key(bool down, SDL_Keycode key, const std::string& name) {
    InputEvent evt;
    evt.type = down ? InputEventType::KeyDown : InputEventType::KeyUp;
    evt.key = key;
    evt.key_name = name;
    return evt;
}

InputEvent DownKey(bool down) {
    return Key(down, SDLK_DOWN, "Down");
}

InputEvent UpKey(bool down) {
    return Key(down, SDLK_UP, "Up");
}

InputEvent ReturnKey(bool down) {
    return Key(down, SDLK_RETURN, "Return");
}

InputEvent MouseMotion(core::Point pos) {
    InputEvent evt;
    evt.type = InputEventType::MouseMotion;
    evt.position = pos;
    evt.relative = core::Point{1, 1};
    return evt;
}

InputEvent LeftClick() {
    InputEvent evt;
    evt.type = InputEventType::MouseButtonDown;
    evt.mouse_button = core::MouseButton::Left;
    return evt;
}

InputEvent JoyHat(core::HatValue value) {
    InputEvent evt;
    evt.type = InputEventType::JoyHatMotion;
    evt.joy_id = 0;
    evt.index = 0;
    evt.hat = value;
    return evt;
}

InputEvent JoyAxis(int axis, float value) {
    InputEvent evt;
    evt.type = InputEventType::JoyAxisMotion;
    evt.joy_id = 0;
    evt.index = axis;
    evt.axis_value = value;
    return evt;
}

InputEvent JoyButton(int button, bool down) {
    InputEvent evt;
    evt.type = down ? InputEventType::JoyButtonDown : InputEventType::JoyButtonUp;
    evt.joy_id = 0;
    evt.index = button;
    return evt;
}

OptionStyle BoxStyle() {
    OptionStyle style;
    style.min_size = core::Size{100, 40};
    return style;
}

void AddThree(Menu& menu) {
    menu.Add("A", BoxStyle());
    menu.Add("B", BoxStyle());
    menu.Add("C", BoxStyle());
}

void TestFirstOptionFocusedOnConstruction() {
    Harness h;
    Menu menu(h.ctx);
    AddThree(menu);
    assert(menu.focused() == 0u);
    assert(menu.option(0).focused());
    assert(!menu.option(1).focused());
    assert(!menu.option(2).focused());
    assert(menu.running());
}

void TestEmptyMenuIsInert() {
    Harness h;
    Menu menu(h.ctx);
    assert(!menu.focused().has_value());
    assert(menu.focused_option() == nullptr);
    menu.Focus(0);
    menu.Apply();
    assert(!menu.focused().has_value());
}

void TestFocusCallsBlurAndFocusOnce() {
    Harness h;
    Menu menu(h.ctx);
    AddThree(menu);
    FocusLog log;
    for (std::size_t i = 0; i < menu.size(); ++i) {
        log.Watch(menu.option(i));
    }

    menu.Focus(0);
    assert(log.entries.empty());

    menu.Focus(1);
    assert((log.entries == std::vector<std::string>{"blur A", "focus B"}));

    menu.Focus(7);
    assert(log.entries.size() == 2);
    assert(menu.focused() == 1u);
}

void TestOptionApply() {
    render::FontCache fonts;

    Option silent(fonts, "NO ACTION");
    assert(!silent.has_action());
    silent.Apply();

    Option empty(fonts, "EMPTY", {}, ui::Action{std::function<void()>{}});
    assert(!empty.has_action());
    empty.Apply();

    int calls = 0;
    Option counted(fonts, "COUNTED", {}, ui::Action{std::function<void()>([&] { ++calls; })});
    assert(counted.has_action());
    counted.Apply();
    counted.Apply();
    assert(calls == 2);
}

void TestFocusSwitchesColorsAndInvalidatesImage() {
    render::FontCache fonts;
    OptionStyle style;
    style.message_color_onblur = core::Color{1, 1, 1, 255};
    style.message_color_onfocus = core::Color{2, 2, 2, 255};
    style.background_color_onfocus = core::Color{3, 3, 3, 255};
    Option option(fonts, "X", style);

    assert(option.text().message_color() == style.message_color_onblur);
    option.area();
    assert(!option.text().stale());

    option.OnFocus();
    assert(option.focused());
    assert(option.text().stale());
    assert(option.text().message_color() == style.message_color_onfocus);
    assert(option.text().background_color() == style.background_color_onfocus);

    option.area();
    option.OnBlur();
    assert(option.text().stale());
    assert(!option.text().background_color().has_value());

    option.area();
    option.set_message("Y");
    assert(option.text().stale());
}

void TestLayoutStacksCentered() {
    Harness h;
    Menu menu(h.ctx);
    AddThree(menu);
    menu.Layout();
    assert(menu.option(0).pos() == (core::Point{350, 240}));
    assert(menu.option(1).pos() == (core::Point{350, 280}));
    assert(menu.option(2).pos() == (core::Point{350, 320}));
}

void TestNextTwiceOnCircularMenu() {
    Harness h({{DownKey(true)}, {DownKey(false)}, {DownKey(true)}, {DownKey(false)}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.LinkChain(true);
    FocusLog log;
    for (std::size_t i = 0; i < menu.size(); ++i) {
        log.Watch(menu.option(i));
    }

    menu.Loop();
    assert(menu.focused() == 2u);
    assert((log.entries ==
            std::vector<std::string>{"blur A", "focus B", "blur B", "focus C"}));
    assert(h.display.presents == h.display.polls);
}

void TestNextFromLastWraps() {
    Harness h({{DownKey(true)}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.LinkChain(true);
    menu.Focus(2);
    menu.Loop();
    assert(menu.focused() == 0u);
}

void TestNextFromLastWithoutWrapStays() {
    Harness h({{DownKey(true)}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.LinkChain(false);
    menu.Focus(2);
    menu.Loop();
    assert(menu.focused() == 2u);
}

void TestPreviousFollowsLinks() {
    Harness h({{UpKey(true)}, {UpKey(false)}, {UpKey(true)}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.Link(0, 1);
    menu.Link(1, 2);
    menu.Link(2, 0);
    menu.Loop();
    assert(menu.focused() == 1u);
}

void TestHeldKeyRepeatsAfterDelay() {
    std::vector<InputBatch> script = {{DownKey(true)}};
    for (int i = 0; i < 9; ++i) {
        script.push_back({});
    }
    Harness h(script);
    Menu menu(h.ctx);
    AddThree(menu);
    menu.Add("D", BoxStyle());
    menu.LinkChain(true);
    menu.Loop();
    // Fired on the press and once more after the 0.233 s delay at 30 Hz.
    assert(menu.focused() == 2u);
}

void TestJoystickHatNavigates() {
    const core::HatValue up{0, 1};
    const core::HatValue down{0, -1};
    const core::HatValue centered{0, 0};
    Harness h({{JoyHat(down)}, {JoyHat(centered)}, {JoyHat(up)}, {JoyHat(centered)}, {JoyHat(up)}},
              true);
    Menu menu(h.ctx);
    AddThree(menu);
    menu.LinkChain(true);
    FocusLog log;
    for (std::size_t i = 0; i < menu.size(); ++i) {
        log.Watch(menu.option(i));
    }

    menu.Loop();
    assert((log.entries == std::vector<std::string>{"blur A", "focus B", "blur B", "focus A",
                                                    "blur A", "focus C"}));
    assert(menu.focused() == 2u);
}

void TestJoystickAxisNavigatesAndRepeats() {
    std::vector<InputBatch> script{{JoyAxis(1, 0.8f)}};
    for (int i = 0; i < 9; ++i) {
        script.push_back({});
    }
    script.push_back({JoyAxis(1, 0.0f)});
    script.push_back({JoyAxis(1, -0.8f)});
    Harness h(std::move(script), true);
    Menu menu(h.ctx);
    AddThree(menu);
    menu.Add("D", BoxStyle());
    menu.LinkChain(true);

    // Down once, one repeat after the delay, then up once.
    menu.Loop();
    assert(menu.focused() == 1u);

    // The horizontal axis does not navigate.
    h.display.Reset({{JoyAxis(0, 1.0f)}});
    menu.Loop();
    assert(menu.focused() == 1u);
}

void TestJoystickButtonConfirms() {
    Harness h({{JoyButton(3, true)},
               {JoyButton(0, true)},
               {},
               {JoyButton(0, false)},
               {JoyButton(0, true)}},
              true);
    Menu menu(h.ctx);
    int calls = 0;
    menu.Add("GO", BoxStyle(), ui::Action{std::function<void()>([&calls] { ++calls; })});

    menu.Loop();
    assert(calls == 2);
}

void TestPointerFocusesFirstOptionUnderIt() {
    Harness h({{MouseMotion({400, 300})}, {MouseMotion({10, 10})}});
    Menu menu(h.ctx);
    AddThree(menu);
    FocusLog log;
    for (std::size_t i = 0; i < menu.size(); ++i) {
        log.Watch(menu.option(i));
    }
    menu.Loop();
    // The second position is outside every option and keeps the focus.
    assert(menu.focused() == 1u);
    assert((log.entries == std::vector<std::string>{"blur A", "focus B"}));
}

void TestPointerOnSharedEdgePicksFirst() {
    Harness h({{MouseMotion({400, 330})}, {MouseMotion({400, 280})}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.Loop();
    // y = 280 is the bottom edge of A and the top edge of B.
    assert(menu.focused() == 0u);
}

void TestClickInsideFocusedOptionApplies() {
    Harness h({{MouseMotion({400, 300}), LeftClick()}, {}, {}});
    Menu menu(h.ctx);
    AddThree(menu);
    int applied = 0;
    menu.OnApply(1, [&](Menu& m) {
        assert(m.focused() == 1u);
        ++applied;
    });
    menu.Loop();
    assert(applied == 1);
}

void TestConfirmRunsActionOncePerPress() {
    std::vector<InputBatch> script = {{ReturnKey(true)}, {}, {}, {}, {ReturnKey(false)},
                                      {ReturnKey(true)}};
    Harness h(script);
    Menu menu(h.ctx);
    int calls = 0;
    menu.Add("GO", BoxStyle(), ui::Action{std::function<void()>([&] { ++calls; })});
    menu.Loop();
    assert(calls == 2);
}

void TestSubMenuBlocksParentUntilClosed() {
    std::vector<InputBatch> script = {{ReturnKey(true)}, {ReturnKey(false)}, {DownKey(true)},
                                      {ReturnKey(true)}, {ReturnKey(false)}, {DownKey(false)}};
    Harness h(script);
    Menu main_menu(h.ctx);
    main_menu.Add("OPEN", BoxStyle());
    main_menu.Add("OTHER", BoxStyle());
    main_menu.LinkChain(true);

    std::vector<std::string> trace;
    main_menu.OnApply(0, [&](Menu& parent) {
        trace.push_back("open");
        Menu sub(parent.context());
        sub.Add("YES", BoxStyle());
        sub.Add("NO", BoxStyle());
        sub.LinkChain(false);
        sub.OnApply(1, [&](Menu& self) {
            trace.push_back("close");
            self.Close();
        });
        sub.Loop();
        assert(!sub.running());
        trace.push_back("back");
    });
    main_menu.Loop();

    assert((trace == std::vector<std::string>{"open", "close", "back"}));
    // The Down press was consumed by the sub-menu.
    assert(main_menu.focused() == 0u);
}

void TestQuitStopsEveryLoop() {
    InputEvent quit;
    quit.type = InputEventType::Quit;
    Harness h({{quit}, {DownKey(true)}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.LinkChain(true);
    menu.Loop();
    assert(h.display.polls == 1);
    assert(!h.display.running());
    assert(menu.running());
}

void TestClosedMenuReopensOnLoop() {
    Harness h({{}});
    Menu menu(h.ctx);
    AddThree(menu);
    menu.Close();
    assert(!menu.running());
    menu.Loop();
    assert(h.display.polls >= 1);
    assert(menu.running());
}

void TestBuildMenuFromSpec() {
    Harness h;
    core::MenuSpec spec = core::MenuSpec::Deserialize(R"({
        "wrap": true,
        "spacing": 10,
        "background": [255, 255, 255],
        "options": ["PLAY", "EDITOR", {"id": "quit", "message": "EXIT"}]
    })");
    Menu menu = ui::BuildMenu(h.ctx, spec, {}, BoxStyle());
    assert(menu.size() == 3);
    assert(menu.focused() == 0u);
    assert(menu.Find("quit") == 2u);
    assert(menu.option(2).message() == "EXIT");
    assert(!menu.Find("missing").has_value());
    assert(menu.next(2) == 0u);
    assert(menu.config().spacing == 10);
    assert(menu.config().background.has_value());
    assert(menu.option(1).style().min_size.h == 40);
}

}  // namespace

int main() {
    TestFirstOptionFocusedOnConstruction();
    TestEmptyMenuIsInert();
    TestFocusCallsBlurAndFocusOnce();
    TestOptionApply();
    TestFocusSwitchesColorsAndInvalidatesImage();
    TestLayoutStacksCentered();
    TestNextTwiceOnCircularMenu();
    TestNextFromLastWraps();
    TestNextFromLastWithoutWrapStays();
    TestPreviousFollowsLinks();
    TestHeldKeyRepeatsAfterDelay();
    TestJoystickHatNavigates();
    TestJoystickAxisNavigatesAndRepeats();
    TestJoystickButtonConfirms();
    TestPointerFocusesFirstOptionUnderIt();
    TestPointerOnSharedEdgePicksFirst();
    TestClickInsideFocusedOptionApplies();
    TestConfirmRunsActionOncePerPress();
    TestSubMenuBlocksParentUntilClosed();
    TestQuitStopsEveryLoop();
    TestClosedMenuReopensOnLoop();
    TestBuildMenuFromSpec();
    std::cout << "All menu tests passed.\n";
    return 0;
}
