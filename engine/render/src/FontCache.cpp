#include "menukit/render/FontCache.hpp"

#include <SDL2/SDL.h>

#include <filesystem>
#include <vector>

#include "menukit/app/AssetFS.hpp"

namespace menukit::render {

namespace {

const std::vector<std::string> kDefaultFonts = {
    "fonts/DejaVuSans-Bold.ttf",
    "fonts/FreeSansBold.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
    "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
    "C:/Windows/Fonts/arialbd.ttf",
};

TTF_Font* OpenFirst(const std::vector<std::string>& candidates, int point_size) {
    for (const auto& candidate : candidates) {
        std::filesystem::path path = menukit::app::AssetPath(candidate);
        if (!menukit::app::FileExists(path)) {
            continue;
        }
        TTF_Font* font = TTF_OpenFont(path.string().c_str(), point_size);
        if (font) {
            TTF_SetFontHinting(font, TTF_HINTING_LIGHT);
            return font;
        }
    }
    return nullptr;
}

}  // namespace

FontCache::~FontCache() {
    Clear();
}

TTF_Font* FontCache::Get(const std::string& file, int point_size) {
    if (TTF_WasInit() == 0 || point_size <= 0) {
        return nullptr;
    }
    const auto key = std::make_pair(file, point_size);
    auto it = fonts_.find(key);
    if (it != fonts_.end()) {
        return it->second;
    }
    TTF_Font* font = file.empty() ? OpenFirst(kDefaultFonts, point_size)
                                  : OpenFirst({file}, point_size);
    if (!font) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No font for '%s' at %d pt: %s",
                    file.empty() ? "<default>" : file.c_str(), point_size, TTF_GetError());
    }
    // Failures are cached too so the warning is logged once.
    fonts_.emplace(key, font);
    return font;
}

void FontCache::Clear() {
    for (auto& entry : fonts_) {
        if (entry.second && TTF_WasInit() != 0) {
            TTF_CloseFont(entry.second);
        }
    }
    fonts_.clear();
}

}  // namespace menukit::render
