#include "menukit/render/Text.hpp"

#include <SDL2/SDL_ttf.h>

#include <utility>

namespace menukit::render {

namespace {

SDL_Color ToSdl(const core::Color& color) {
    return SDL_Color{color.r, color.g, color.b, color.a};
}

}  // namespace

Text::Text(FontCache& fonts, std::string message, TextStyle style, const core::Point& pos)
    : Sprite(pos), fonts_(&fonts), message_(std::move(message)), style_(std::move(style)) {}

void Text::set_message(const std::string& value) {
    message_ = value;
    Invalidate();
}

void Text::set_font_file(const std::string& value) {
    style_.font_file = value;
    Invalidate();
}

void Text::set_font_size(int value) {
    style_.font_size = value;
    Invalidate();
}

void Text::set_antialias(bool value) {
    style_.antialias = value;
    Invalidate();
}

void Text::set_message_color(const core::Color& value) {
    style_.message_color = value;
    Invalidate();
}

void Text::set_background_color(const std::optional<core::Color>& value) {
    style_.background_color = value;
    Invalidate();
}

SurfacePtr Text::RenderImage() const {
    if (message_.empty()) {
        return nullptr;
    }
    TTF_Font* font = fonts_->Get(style_.font_file, style_.font_size);
    if (!font) {
        return nullptr;
    }
    const SDL_Color fg = ToSdl(style_.message_color);
    SurfacePtr glyphs(style_.antialias ? TTF_RenderUTF8_Blended(font, message_.c_str(), fg)
                                       : TTF_RenderUTF8_Solid(font, message_.c_str(), fg));
    if (!glyphs) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Text render failed: %s", TTF_GetError());
        return nullptr;
    }
    if (!style_.background_color) {
        return glyphs;
    }
    SurfacePtr composed(SDL_CreateRGBSurfaceWithFormat(0, glyphs->w, glyphs->h, 32,
                                                       SDL_PIXELFORMAT_RGBA32));
    if (!composed) {
        return glyphs;
    }
    const core::Color& bg = *style_.background_color;
    SDL_FillRect(composed.get(), nullptr, SDL_MapRGBA(composed->format, bg.r, bg.g, bg.b, bg.a));
    SDL_SetSurfaceBlendMode(glyphs.get(), SDL_BLENDMODE_BLEND);
    SDL_BlitSurface(glyphs.get(), nullptr, composed.get(), nullptr);
    return composed;
}

}  // namespace menukit::render
