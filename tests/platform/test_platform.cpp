#include <SDL2/SDL.h>

#include <cassert>
#include <iostream>

#include "menukit/core/InputEvents.hpp"
#include "menukit/core/ScreenFlags.hpp"
#include "menukit/platform/Screen.hpp"
#include "menukit/platform/SdlInput.hpp"

using namespace menukit;

namespace {

void TestWindowFlags() {
    core::ScreenFlags flags;
    assert(platform::WindowFlags(flags) == SDL_WINDOW_SHOWN);
    assert(platform::RendererFlags(flags) == 0);

    flags.fullscreen = true;
    flags.noframe = true;
    const Uint32 window = platform::WindowFlags(flags);
    assert(window & SDL_WINDOW_FULLSCREEN);
    assert(window & SDL_WINDOW_BORDERLESS);
    assert(!(window & SDL_WINDOW_RESIZABLE));
    assert(!(window & SDL_WINDOW_OPENGL));

    flags = core::ScreenFlags::FromNames({"RESIZABLE", "OPENGL"});
    assert(platform::WindowFlags(flags) ==
           (SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_OPENGL));
    assert(platform::RendererFlags(flags) == 0);
}

void TestRendererFlags() {
    auto flags = core::ScreenFlags::FromNames({"HWSURFACE"});
    assert(platform::RendererFlags(flags) == SDL_RENDERER_ACCELERATED);

    flags.doublebuf = true;
    assert(platform::RendererFlags(flags) ==
           (SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC));
    assert(platform::WindowFlags(flags) == SDL_WINDOW_SHOWN);
}

void PushKeyDown(SDL_Keycode key, Uint8 repeat) {
    SDL_Event event{};
    event.type = SDL_KEYDOWN;
    event.key.state = SDL_PRESSED;
    event.key.repeat = repeat;
    event.key.keysym.sym = key;
    const int pushed = SDL_PushEvent(&event);
    assert(pushed == 1);
}

void PushMouseButton(Uint8 button) {
    SDL_Event event{};
    event.type = SDL_MOUSEBUTTONDOWN;
    event.button.state = SDL_PRESSED;
    event.button.button = button;
    event.button.x = 12;
    event.button.y = 34;
    const int pushed = SDL_PushEvent(&event);
    assert(pushed == 1);
}

void TestPollSkipsKeyRepeat() {
    PushKeyDown(SDLK_RETURN, 0);
    PushKeyDown(SDLK_RETURN, 1);
    PushKeyDown(SDLK_RETURN, 1);

    platform::SdlInput input;
    const core::InputBatch events = input.Poll();
    int key_downs = 0;
    for (const auto& evt : events) {
        if (evt.type == core::InputEventType::KeyDown) {
            ++key_downs;
            assert(evt.key == SDLK_RETURN);
            assert(evt.key_name == "Return");
        }
    }
    assert(key_downs == 1);
}

void TestPollDropsUnknownMouseButtons() {
    PushMouseButton(SDL_BUTTON_X2 + 1);
    PushMouseButton(SDL_BUTTON_X2);
    PushMouseButton(SDL_BUTTON_LEFT);

    platform::SdlInput input;
    const core::InputBatch events = input.Poll();
    int presses = 0;
    for (const auto& evt : events) {
        if (evt.type != core::InputEventType::MouseButtonDown) {
            continue;
        }
        ++presses;
        assert(evt.position == (core::Point{12, 34}));
    }
    assert(presses == 2);
    int x2 = 0;
    for (const auto& evt : events) {
        if (evt.type == core::InputEventType::MouseButtonDown &&
            evt.mouse_button == core::MouseButton::X2) {
            ++x2;
        }
    }
    assert(x2 == 1);
}

}  // namespace

int main() {
    TestWindowFlags();
    TestRendererFlags();

    if (SDL_Init(SDL_INIT_EVENTS) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    TestPollSkipsKeyRepeat();
    TestPollDropsUnknownMouseButtons();
    SDL_Quit();

    std::cout << "All platform tests passed.\n";
    return 0;
}
