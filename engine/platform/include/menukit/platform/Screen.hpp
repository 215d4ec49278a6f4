#pragma once

#include <SDL2/SDL.h>

#include <string>

#include "menukit/core/AppConfig.hpp"
#include "menukit/core/InputEvents.hpp"
#include "menukit/core/ScreenFlags.hpp"
#include "menukit/core/Types.hpp"

namespace menukit::platform {

// SDL window flags for a set of mode flags.
Uint32 WindowFlags(const core::ScreenFlags& flags);
// SDL renderer flags for a set of mode flags (HWSURFACE, DOUBLEBUF).
Uint32 RendererFlags(const core::ScreenFlags& flags);

// The application window. Every mode or size change is applied at once;
// failures raise BackendError.
class Screen {
public:
    explicit Screen(const core::ScreenConfig& config = {});
    ~Screen();

    Screen(const Screen&) = delete;
    Screen& operator=(const Screen&) = delete;

    void Update(const core::InputBatch& events);

    void Clear();
    void Present();

    bool running() const noexcept { return running_; }
    void set_running(bool value) noexcept { running_ = value; }

    int width() const noexcept { return size().w; }
    int height() const noexcept { return size().h; }
    core::Size size() const noexcept;
    void set_width(int value);
    void set_height(int value);
    void set_size(const core::Size& value);

    int fullscreen_width() const noexcept { return fullscreen_size_.w; }
    int fullscreen_height() const noexcept { return fullscreen_size_.h; }
    const core::Size& fullscreen_size() const noexcept { return fullscreen_size_; }

    bool fullscreen() const noexcept { return flags_.fullscreen; }
    void set_fullscreen(bool value);
    bool doublebuf() const noexcept { return flags_.doublebuf; }
    void set_doublebuf(bool value);
    bool hwsurface() const noexcept { return flags_.hwsurface; }
    void set_hwsurface(bool value);
    bool opengl() const noexcept { return flags_.opengl; }
    void set_opengl(bool value);
    bool resizable() const noexcept { return flags_.resizable; }
    void set_resizable(bool value);
    bool noframe() const noexcept { return flags_.noframe; }
    void set_noframe(bool value);

    const core::ScreenFlags& flags() const noexcept { return flags_; }
    Uint32 window_flags() const noexcept { return WindowFlags(flags_); }
    Uint32 renderer_flags() const noexcept { return RendererFlags(flags_); }

    const core::Color& color() const noexcept { return color_; }
    void set_color(const core::Color& value);

    const std::string& title() const noexcept { return title_; }
    void set_title(const std::string& value);

    core::Rect area() const noexcept;
    SDL_Window* window() const noexcept { return window_; }
    SDL_Renderer* renderer() const noexcept { return renderer_; }

private:
    void ResetScreen();
    void ResetColor();
    void ResetTitle();
    void OpenWindow();
    void CloseWindow();

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    Uint32 applied_window_flags_ = 0;
    Uint32 applied_renderer_flags_ = 0;
    core::Size windowed_size_{800, 600};
    core::Size fullscreen_size_{800, 600};
    core::Color color_{};
    std::string title_;
    core::ScreenFlags flags_{};
    bool running_ = true;
};

class Clock {
public:
    Clock();

    // Sleeps so that calls happen at most `rate` times per second (no limit
    // when rate <= 0) and returns the milliseconds since the previous call.
    Uint32 Tick(int rate = 0);

    Uint32 last_frame_ms() const noexcept { return last_frame_ms_; }
    float Fps() const noexcept { return fps_; }

private:
    Uint32 last_tick_ = 0;
    Uint32 last_frame_ms_ = 0;
    float fps_ = 0.0f;
};

}  // namespace menukit::platform
