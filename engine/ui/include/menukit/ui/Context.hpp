#pragma once

#include "menukit/core/Devices.hpp"
#include "menukit/platform/DisplayBackend.hpp"
#include "menukit/render/FontCache.hpp"

namespace menukit::ui {

// Devices shared by every menu of the application. Built once at startup and
// passed by reference; the joystick is optional.
struct Context {
    platform::DisplayBackend& display;
    core::Keyboard& keyboard;
    core::Mouse& mouse;
    render::FontCache& fonts;
    core::Joystick* joystick = nullptr;
};

}  // namespace menukit::ui
