#define SDL_MAIN_HANDLED

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <SDL2/SDL_main.h>
#include <SDL2/SDL_ttf.h>

#include "menukit/app/AssetFS.hpp"
#include "menukit/core/AppConfig.hpp"
#include "menukit/core/Devices.hpp"
#include "menukit/core/MenuSpec.hpp"
#include "menukit/platform/BackendError.hpp"
#include "menukit/platform/ConfigStore.hpp"
#include "menukit/platform/Screen.hpp"
#include "menukit/platform/SdlDisplay.hpp"
#include "menukit/platform/SdlInput.hpp"
#include "menukit/render/FontCache.hpp"
#include "menukit/ui/Context.hpp"
#include "menukit/ui/Menu.hpp"
#include "menukit/ui/MenuBuilder.hpp"

using menukit::app::AssetPath;
using menukit::core::AppConfig;
using menukit::core::MenuSpec;
using menukit::core::OptionSpec;
using menukit::platform::BackendError;
using menukit::platform::ConfigStore;
using menukit::platform::Screen;
using menukit::platform::SdlDisplay;
using menukit::platform::SdlInput;
using menukit::ui::BuildMenu;
using menukit::ui::Context;
using menukit::ui::Menu;
using menukit::ui::MenuConfig;
using menukit::ui::OptionStyle;

namespace {

MenuSpec FallbackSpec(const std::vector<std::string>& messages, bool wrap) {
    MenuSpec spec;
    spec.wrap = wrap;
    for (const auto& message : messages) {
        OptionSpec option;
        option.id = message;
        option.message = message;
        spec.options.push_back(option);
    }
    return spec;
}

MenuSpec LoadMenuSpec(const ConfigStore& store, const std::string& name, MenuSpec fallback) {
    std::string text;
    const auto path = AssetPath("menus/" + name);
    if (!store.ReadText(path, text)) {
        return fallback;
    }
    try {
        return MenuSpec::Deserialize(text);
    } catch (const std::exception& ex) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring %s: %s", path.string().c_str(),
                    ex.what());
        return fallback;
    }
}

struct Demo {
    Context& ctx;
    Screen& screen;
    ConfigStore& store;
    AppConfig& config;
    OptionStyle style;

    Menu Build(const std::string& name, std::vector<std::string> fallback, bool wrap) {
        return BuildMenu(ctx, LoadMenuSpec(store, name, FallbackSpec(fallback, wrap)),
                         MenuConfig::FromApp(config), style);
    }

    void Bind(Menu& menu, const std::string& id, menukit::ui::Handler handler) {
        if (auto index = menu.Find(id)) {
            menu.OnApply(*index, std::move(handler));
        }
    }

    void Persist() {
        config.screen.flags = screen.flags();
        if (!store.Save(config)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Could not write %s",
                        store.settings_path().string().c_str());
        }
    }

    void RunExitMenu() {
        Menu exit_menu = Build("exit.json", {"YES", "NO"}, false);
        Bind(exit_menu, "YES", [this](Menu&) { ctx.display.set_running(false); });
        Bind(exit_menu, "NO", [](Menu& menu) { menu.Close(); });
        exit_menu.Loop();
    }

    void RunOptionsMenu() {
        Menu options_menu = Build("options.json", {"FULLSCREEN", "NOFRAME", "BACK"}, true);
        Bind(options_menu, "FULLSCREEN", [this](Menu&) {
            screen.set_fullscreen(!screen.fullscreen());
            Persist();
        });
        Bind(options_menu, "NOFRAME", [this](Menu&) {
            screen.set_noframe(!screen.noframe());
            Persist();
        });
        Bind(options_menu, "BACK", [](Menu& menu) { menu.Close(); });
        options_menu.Loop();
    }

    void Run(SdlDisplay& display) {
        Menu main_menu = Build("main.json", {"PLAY", "EDITOR", "OPTIONS", "EXIT"}, true);
        Bind(main_menu, "OPTIONS", [this](Menu&) { RunOptionsMenu(); });
        Bind(main_menu, "EXIT", [this](Menu&) { RunExitMenu(); });

        while (screen.running()) {
            const auto events = display.Poll();
            display.Update(events);
            ctx.keyboard.Update(events);
            ctx.mouse.Update(events);

            if (menukit::core::IsPushed(ctx.keyboard.PushName("Escape"))) {
                screen.set_running(false);
            }

            main_menu.Loop();

            screen.Present();
            display.clock().Tick(config.main_rate);
        }
    }
};

}  // namespace

int main(int /*argc*/, char* /*argv*/[]) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_JOYSTICK) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    const int img_flags = IMG_INIT_PNG;
    const int img_result = IMG_Init(img_flags);
    if ((img_result & img_flags) != img_flags) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "IMG_Init failed: %s", IMG_GetError());
    }

    if (TTF_Init() != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TTF_Init failed: %s", TTF_GetError());
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    ConfigStore store("");
    if (!store.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Config directory unavailable: %s",
                    store.root().string().c_str());
    }
    AppConfig config = store.Load();
    if (config.screen.title == "menukit window") {
        config.screen.title = "Lab";
    }

    int exit_code = 0;
    try {
        Screen screen(config.screen);
        SdlInput input;
        input.Initialize();
        SdlDisplay display(screen, input);

        menukit::core::Keyboard keyboard;
        menukit::core::Mouse mouse;
        std::optional<menukit::core::Joystick> joystick;
        if (input.JoystickCount() > 0) {
            joystick.emplace(0);
            SDL_Log("Joystick: %s", input.JoystickName(0).c_str());
        }
        menukit::render::FontCache fonts;

        // Pointer starts at the window centre; hidden when a pad drives the menus.
        const menukit::core::Rect area = screen.area();
        SdlInput::WarpCursor(screen.window(), {area.x + area.w / 2, area.y + area.h / 2});
        SdlInput::SetCursorVisible(!joystick);

        Context ctx{display, keyboard, mouse, fonts, joystick ? &*joystick : nullptr};

        OptionStyle style;
        style.font_file = config.font_file;
        style.font_size = config.font_size;

        Demo demo{ctx, screen, store, config, style};
        demo.Run(display);
    } catch (const BackendError& ex) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", ex.what());
        exit_code = 1;
    }

    TTF_Quit();
    IMG_Quit();
    SDL_Quit();
    return exit_code;
}
