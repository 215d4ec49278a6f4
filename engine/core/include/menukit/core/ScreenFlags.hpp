#pragma once

#include <string>
#include <vector>

namespace menukit::core {

struct ScreenFlags {
    bool fullscreen = false;
    bool doublebuf = false;
    bool hwsurface = false;
    bool opengl = false;
    bool resizable = false;
    bool noframe = false;

    // Accepts FULLSCREEN, DOUBLEBUF, HWSURFACE, OPENGL, RESIZABLE and NOFRAME.
    // Throws std::invalid_argument for any other name.
    static ScreenFlags FromNames(const std::vector<std::string>& names);
    // Sets the named flag; false if the name is unknown.
    bool Set(const std::string& name);
    std::vector<std::string> Names() const;

    bool operator==(const ScreenFlags& other) const noexcept {
        return fullscreen == other.fullscreen && doublebuf == other.doublebuf &&
               hwsurface == other.hwsurface && opengl == other.opengl &&
               resizable == other.resizable && noframe == other.noframe;
    }
};

}  // namespace menukit::core
