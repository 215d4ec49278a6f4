#pragma once

#include <stdexcept>
#include <string>

namespace menukit::platform {

// Raised when the display backend cannot honour a request, such as creating
// the window or switching display mode. Carries SDL_GetError() text.
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& what);
};

}  // namespace menukit::platform
