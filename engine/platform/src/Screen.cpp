#include "menukit/platform/Screen.hpp"

#include "menukit/platform/BackendError.hpp"

namespace menukit::platform {

namespace {

// Changing any of these requires a new window.
constexpr Uint32 kRecreateWindowFlags = SDL_WINDOW_OPENGL;

BackendError SdlFailure(const std::string& what) {
    return BackendError(what + ": " + SDL_GetError());
}

}  // namespace

Uint32 WindowFlags(const core::ScreenFlags& flags) {
    Uint32 result = SDL_WINDOW_SHOWN;
    if (flags.fullscreen) {
        result |= SDL_WINDOW_FULLSCREEN;
    }
    if (flags.opengl) {
        result |= SDL_WINDOW_OPENGL;
    }
    if (flags.resizable) {
        result |= SDL_WINDOW_RESIZABLE;
    }
    if (flags.noframe) {
        result |= SDL_WINDOW_BORDERLESS;
    }
    return result;
}

Uint32 RendererFlags(const core::ScreenFlags& flags) {
    Uint32 result = 0;
    if (flags.hwsurface) {
        result |= SDL_RENDERER_ACCELERATED;
    }
    if (flags.doublebuf) {
        result |= SDL_RENDERER_PRESENTVSYNC;
    }
    return result;
}

Screen::Screen(const core::ScreenConfig& config)
    : windowed_size_{config.size[0], config.size[1]},
      color_(config.color),
      title_(config.title),
      flags_(config.flags) {
    SDL_DisplayMode mode;
    if (SDL_GetDesktopDisplayMode(0, &mode) == 0) {
        fullscreen_size_ = core::Size{mode.w, mode.h};
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Desktop mode unavailable: %s", SDL_GetError());
        fullscreen_size_ = windowed_size_;
    }
    ResetScreen();
}

Screen::~Screen() {
    CloseWindow();
}

void Screen::OpenWindow() {
    const Uint32 window_flags = WindowFlags(flags_);
    const core::Size target = size();
    window_ = SDL_CreateWindow(title_.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               target.w, target.h, window_flags);
    if (!window_) {
        throw SdlFailure("SDL_CreateWindow failed");
    }
    const Uint32 renderer_flags = RendererFlags(flags_);
    renderer_ = SDL_CreateRenderer(window_, -1, renderer_flags);
    if (!renderer_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        throw SdlFailure("SDL_CreateRenderer failed");
    }
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    applied_window_flags_ = window_flags;
    applied_renderer_flags_ = renderer_flags;
}

void Screen::CloseWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
}

void Screen::ResetScreen() {
    const Uint32 window_flags = WindowFlags(flags_);
    const Uint32 renderer_flags = RendererFlags(flags_);
    const bool recreate = !window_ ||
                          ((window_flags ^ applied_window_flags_) & kRecreateWindowFlags) != 0 ||
                          renderer_flags != applied_renderer_flags_;
    if (recreate) {
        CloseWindow();
        OpenWindow();
    } else {
        if (SDL_SetWindowFullscreen(window_, flags_.fullscreen ? SDL_WINDOW_FULLSCREEN : 0) != 0) {
            throw SdlFailure("SDL_SetWindowFullscreen failed");
        }
        SDL_SetWindowBordered(window_, flags_.noframe ? SDL_FALSE : SDL_TRUE);
        SDL_SetWindowResizable(window_, flags_.resizable ? SDL_TRUE : SDL_FALSE);
        const core::Size target = size();
        SDL_SetWindowSize(window_, target.w, target.h);
        applied_window_flags_ = window_flags;
    }
    ResetColor();
    ResetTitle();
}

void Screen::ResetColor() {
    Clear();
}

void Screen::ResetTitle() {
    if (window_) {
        SDL_SetWindowTitle(window_, title_.c_str());
    }
}

void Screen::Update(const core::InputBatch& events) {
    for (const auto& evt : events) {
        switch (evt.type) {
            case core::InputEventType::Quit:
                running_ = false;
                break;
            case core::InputEventType::WindowResize:
                if (!flags_.fullscreen && evt.size != windowed_size_) {
                    windowed_size_ = evt.size;
                }
                break;
            default:
                break;
        }
    }
}

void Screen::Clear() {
    if (!renderer_) {
        return;
    }
    SDL_SetRenderDrawColor(renderer_, color_.r, color_.g, color_.b, color_.a);
    SDL_RenderClear(renderer_);
}

void Screen::Present() {
    if (renderer_) {
        SDL_RenderPresent(renderer_);
    }
}

core::Size Screen::size() const noexcept {
    return flags_.fullscreen ? fullscreen_size_ : windowed_size_;
}

void Screen::set_width(int value) {
    windowed_size_.w = value;
    ResetScreen();
}

void Screen::set_height(int value) {
    windowed_size_.h = value;
    ResetScreen();
}

void Screen::set_size(const core::Size& value) {
    windowed_size_ = value;
    ResetScreen();
}

void Screen::set_fullscreen(bool value) {
    flags_.fullscreen = value;
    ResetScreen();
}

void Screen::set_doublebuf(bool value) {
    flags_.doublebuf = value;
    ResetScreen();
}

void Screen::set_hwsurface(bool value) {
    flags_.hwsurface = value;
    ResetScreen();
}

void Screen::set_opengl(bool value) {
    flags_.opengl = value;
    ResetScreen();
}

void Screen::set_resizable(bool value) {
    flags_.resizable = value;
    ResetScreen();
}

void Screen::set_noframe(bool value) {
    flags_.noframe = value;
    ResetScreen();
}

void Screen::set_color(const core::Color& value) {
    color_ = value;
    ResetColor();
}

void Screen::set_title(const std::string& value) {
    title_ = value;
    ResetTitle();
}

core::Rect Screen::area() const noexcept {
    const core::Size current = size();
    return core::Rect{0, 0, current.w, current.h};
}

Clock::Clock() : last_tick_(SDL_GetTicks()) {}

Uint32 Clock::Tick(int rate) {
    Uint32 now = SDL_GetTicks();
    if (rate > 0) {
        const Uint32 frame_ms = 1000u / static_cast<Uint32>(rate);
        const Uint32 elapsed = now - last_tick_;
        if (elapsed < frame_ms) {
            SDL_Delay(frame_ms - elapsed);
            now = SDL_GetTicks();
        }
    }
    last_frame_ms_ = now - last_tick_;
    last_tick_ = now;
    if (last_frame_ms_ > 0) {
        const float instant = 1000.0f / static_cast<float>(last_frame_ms_);
        fps_ = fps_ <= 0.0f ? instant : fps_ * 0.9f + instant * 0.1f;
    }
    return last_frame_ms_;
}

}  // namespace menukit::platform
