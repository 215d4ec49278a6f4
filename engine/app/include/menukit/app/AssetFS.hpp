#pragma once

#include <filesystem>
#include <string>

namespace menukit::app {

bool FileExists(const std::filesystem::path& path);

// Resolves a font, image or menu file. Absolute and already reachable paths
// are returned as given; otherwise the first assets/ directory holding the
// file wins. Search order: $MENUKIT_ASSETS, then assets/ directories above the
// working directory, then above the executable. Unresolved names come back
// unchanged.
std::filesystem::path AssetPath(const std::string& filename);

}  // namespace menukit::app
