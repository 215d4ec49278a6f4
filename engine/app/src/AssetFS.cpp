#include "menukit/app/AssetFS.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace menukit::app {

namespace {

namespace fs = std::filesystem;

constexpr int kSearchDepth = 8;

void AddRoot(std::vector<fs::path>& roots, const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return;
    }
    if (std::find(roots.begin(), roots.end(), dir) == roots.end()) {
        roots.push_back(dir);
    }
}

void AddAssetDirsAbove(std::vector<fs::path>& roots, fs::path dir) {
    for (int depth = 0; depth < kSearchDepth && !dir.empty(); ++depth) {
        AddRoot(roots, dir / "assets");
        if (dir == dir.parent_path()) {
            break;
        }
        dir = dir.parent_path();
    }
}

std::vector<fs::path> FindAssetRoots() {
    std::vector<fs::path> roots;
    if (const char* env = std::getenv("MENUKIT_ASSETS")) {
        AddRoot(roots, fs::path(env));
    }
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        AddAssetDirsAbove(roots, cwd);
    }
    if (char* base = SDL_GetBasePath()) {
        AddAssetDirsAbove(roots, fs::path(base));
        SDL_free(base);
    }
    return roots;
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::filesystem::path AssetPath(const std::string& filename) {
    const fs::path requested(filename);
    if (requested.is_absolute() || FileExists(requested)) {
        return requested;
    }
    static const std::vector<fs::path> roots = FindAssetRoots();
    for (const auto& root : roots) {
        fs::path candidate = root / requested;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return requested;
}

}  // namespace menukit::app
