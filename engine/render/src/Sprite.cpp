#include "menukit/render/Sprite.hpp"

#include <SDL2/SDL_image.h>

#include <utility>

#include "menukit/app/AssetFS.hpp"

namespace menukit::render {

Sprite::Sprite(const core::Point& pos) : pos_(pos), area_{pos.x, pos.y, 0, 0} {}

void Sprite::Refresh() {
    image_ = RenderImage();
    area_.x = pos_.x;
    area_.y = pos_.y;
    area_.w = image_ ? image_->w : 0;
    area_.h = image_ ? image_->h : 0;
    stale_ = false;
}

SDL_Surface* Sprite::image() {
    if (stale_) {
        Refresh();
    }
    return image_.get();
}

const core::Rect& Sprite::area() {
    if (stale_) {
        Refresh();
    }
    return area_;
}

void Sprite::BlitOn(SDL_Renderer* renderer) {
    BlitOn(renderer, area());
}

void Sprite::BlitOn(SDL_Renderer* renderer, const core::Rect& destination) {
    SDL_Surface* surface = image();
    if (!renderer || !surface) {
        return;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        return;
    }
    SDL_Rect dst{destination.x, destination.y, destination.w, destination.h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    SDL_DestroyTexture(texture);
}

void Sprite::set_x(int value) {
    pos_.x = value;
    area_.x = value;
}

void Sprite::set_y(int value) {
    pos_.y = value;
    area_.y = value;
}

void Sprite::set_pos(const core::Point& value) {
    pos_ = value;
    area_.x = value.x;
    area_.y = value.y;
}

SolidSprite::SolidSprite(const core::Point& pos, const core::Size& size, const core::Color& color)
    : Sprite(pos), size_(size), color_(color) {}

SurfacePtr SolidSprite::RenderImage() const {
    if (size_.w <= 0 || size_.h <= 0) {
        return nullptr;
    }
    SurfacePtr surface(
        SDL_CreateRGBSurfaceWithFormat(0, size_.w, size_.h, 32, SDL_PIXELFORMAT_RGBA32));
    if (!surface) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Surface %dx%d failed: %s", size_.w, size_.h,
                    SDL_GetError());
        return nullptr;
    }
    SDL_FillRect(surface.get(), nullptr,
                 SDL_MapRGBA(surface->format, color_.r, color_.g, color_.b, color_.a));
    return surface;
}

void SolidSprite::set_width(int value) {
    size_.w = value;
    Invalidate();
}

void SolidSprite::set_height(int value) {
    size_.h = value;
    Invalidate();
}

void SolidSprite::set_size(const core::Size& value) {
    size_ = value;
    Invalidate();
}

void SolidSprite::set_color(const core::Color& value) {
    color_ = value;
    Invalidate();
}

ImageSprite::ImageSprite(std::string path, const core::Point& pos)
    : Sprite(pos), path_(std::move(path)) {}

void ImageSprite::set_path(const std::string& value) {
    path_ = value;
    Invalidate();
}

SurfacePtr ImageSprite::RenderImage() const {
    if (path_.empty()) {
        return nullptr;
    }
    const auto resolved = menukit::app::AssetPath(path_);
    SurfacePtr surface(IMG_Load(resolved.string().c_str()));
    if (!surface) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load %s: %s",
                    resolved.string().c_str(), IMG_GetError());
    }
    return surface;
}

}  // namespace menukit::render
