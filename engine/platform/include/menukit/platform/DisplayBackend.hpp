#pragma once

#include <SDL2/SDL.h>

#include "menukit/core/InputEvents.hpp"
#include "menukit/core/Types.hpp"

namespace menukit::platform {

// What a blocking interaction loop needs from the outside world: one event
// batch per iteration, a place to draw, and a rate limiter.
class DisplayBackend {
public:
    virtual ~DisplayBackend() = default;

    virtual core::InputBatch Poll() = 0;
    // Applies window-level events (quit, resize) of a batch.
    virtual void Update(const core::InputBatch& events) = 0;

    // Application-wide running flag.
    virtual bool running() const = 0;
    virtual void set_running(bool running) = 0;

    virtual core::Rect area() const = 0;
    // Null when nothing can be drawn.
    virtual SDL_Renderer* renderer() const = 0;

    virtual void Clear() = 0;
    virtual void Present() = 0;
    virtual void Throttle(int rate) = 0;
};

}  // namespace menukit::platform
