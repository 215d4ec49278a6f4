#pragma once

#include "menukit/platform/DisplayBackend.hpp"
#include "menukit/platform/Screen.hpp"
#include "menukit/platform/SdlInput.hpp"

namespace menukit::platform {

// DisplayBackend over a real SDL window. Borrows the screen and input, which
// outlive it; owns the clock used for throttling.
class SdlDisplay : public DisplayBackend {
public:
    SdlDisplay(Screen& screen, SdlInput& input);

    core::InputBatch Poll() override;
    void Update(const core::InputBatch& events) override;

    bool running() const override;
    void set_running(bool running) override;

    core::Rect area() const override;
    SDL_Renderer* renderer() const override;

    void Clear() override;
    void Present() override;
    void Throttle(int rate) override;

    Screen& screen() noexcept { return screen_; }
    Clock& clock() noexcept { return clock_; }

private:
    Screen& screen_;
    SdlInput& input_;
    Clock clock_;
};

}  // namespace menukit::platform
