#include "menukit/platform/SdlDisplay.hpp"

namespace menukit::platform {

SdlDisplay::SdlDisplay(Screen& screen, SdlInput& input) : screen_(screen), input_(input) {}

core::InputBatch SdlDisplay::Poll() {
    return input_.Poll();
}

void SdlDisplay::Update(const core::InputBatch& events) {
    screen_.Update(events);
}

bool SdlDisplay::running() const {
    return screen_.running();
}

void SdlDisplay::set_running(bool running) {
    screen_.set_running(running);
}

core::Rect SdlDisplay::area() const {
    return screen_.area();
}

SDL_Renderer* SdlDisplay::renderer() const {
    return screen_.renderer();
}

void SdlDisplay::Clear() {
    screen_.Clear();
}

void SdlDisplay::Present() {
    screen_.Present();
}

void SdlDisplay::Throttle(int rate) {
    clock_.Tick(rate);
}

}  // namespace menukit::platform
