#pragma once

#include <SDL2/SDL.h>

#include <string>
#include <vector>

#include "menukit/core/InputEvents.hpp"
#include "menukit/core/Types.hpp"

namespace menukit::platform {

class SdlInput {
public:
    SdlInput() = default;
    ~SdlInput();

    SdlInput(const SdlInput&) = delete;
    SdlInput& operator=(const SdlInput&) = delete;

    bool Initialize();
    void Shutdown();
    core::InputBatch Poll();

    // Name of the joystick at a device index, or a placeholder when absent.
    std::string JoystickName(int device_index) const;
    int JoystickCount() const { return static_cast<int>(joysticks_.size()); }

    static void SetCursorVisible(bool visible);
    static void WarpCursor(SDL_Window* window, const core::Point& pos);

private:
    struct JoystickEntry {
        SDL_JoystickID instance_id = -1;
        int device_index = 0;
        SDL_Joystick* joystick = nullptr;
    };

    void OpenJoystick(int device_index);
    void CloseJoystick(SDL_JoystickID instance_id);
    int DeviceIndex(SDL_JoystickID instance_id) const;

    bool initialized_ = false;
    std::vector<JoystickEntry> joysticks_;
};

}  // namespace menukit::platform
