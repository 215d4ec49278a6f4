#include "menukit/core/ScreenFlags.hpp"

#include <stdexcept>

namespace menukit::core {

ScreenFlags ScreenFlags::FromNames(const std::vector<std::string>& names) {
    ScreenFlags flags;
    for (const auto& name : names) {
        if (!flags.Set(name)) {
            throw std::invalid_argument("Unknown screen flag: " + name);
        }
    }
    return flags;
}

bool ScreenFlags::Set(const std::string& name) {
    if (name == "FULLSCREEN") {
        fullscreen = true;
    } else if (name == "DOUBLEBUF") {
        doublebuf = true;
    } else if (name == "HWSURFACE") {
        hwsurface = true;
    } else if (name == "OPENGL") {
        opengl = true;
    } else if (name == "RESIZABLE") {
        resizable = true;
    } else if (name == "NOFRAME") {
        noframe = true;
    } else {
        return false;
    }
    return true;
}

std::vector<std::string> ScreenFlags::Names() const {
    std::vector<std::string> names;
    if (fullscreen) {
        names.emplace_back("FULLSCREEN");
    }
    if (doublebuf) {
        names.emplace_back("DOUBLEBUF");
    }
    if (hwsurface) {
        names.emplace_back("HWSURFACE");
    }
    if (opengl) {
        names.emplace_back("OPENGL");
    }
    if (resizable) {
        names.emplace_back("RESIZABLE");
    }
    if (noframe) {
        names.emplace_back("NOFRAME");
    }
    return names;
}

}  // namespace menukit::core
