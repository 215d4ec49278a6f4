#pragma once

#include <SDL2/SDL_ttf.h>

#include <map>
#include <string>
#include <utility>

namespace menukit::render {

// Open fonts keyed by (file, point size). An empty file name selects the
// first available default font. Returns null while SDL_ttf is not
// initialised or when no font file can be opened.
class FontCache {
public:
    FontCache() = default;
    ~FontCache();

    FontCache(const FontCache&) = delete;
    FontCache& operator=(const FontCache&) = delete;

    TTF_Font* Get(const std::string& file, int point_size);
    void Clear();

private:
    std::map<std::pair<std::string, int>, TTF_Font*> fonts_;
};

}  // namespace menukit::render
