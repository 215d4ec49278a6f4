#pragma once

#include <SDL2/SDL.h>

#include <memory>
#include <string>

#include "menukit/core/Types.hpp"

namespace menukit::render {

struct SurfaceDeleter {
    void operator()(SDL_Surface* surface) const noexcept { SDL_FreeSurface(surface); }
};

using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

// A positioned image. Subclasses produce the image in RenderImage(); it is
// cached and rebuilt, along with the area, after Invalidate().
class Sprite {
public:
    explicit Sprite(const core::Point& pos = {});
    virtual ~Sprite() = default;

    Sprite(Sprite&&) noexcept = default;
    Sprite& operator=(Sprite&&) noexcept = default;
    Sprite(const Sprite&) = delete;
    Sprite& operator=(const Sprite&) = delete;

    void BlitOn(SDL_Renderer* renderer);
    // Stretches the image over `destination`.
    void BlitOn(SDL_Renderer* renderer, const core::Rect& destination);

    SDL_Surface* image();
    const core::Rect& area();

    int x() const noexcept { return pos_.x; }
    void set_x(int value);
    int y() const noexcept { return pos_.y; }
    void set_y(int value);
    const core::Point& pos() const noexcept { return pos_; }
    void set_pos(const core::Point& value);

    int width() { return area().w; }
    int height() { return area().h; }
    core::Size size() { return area().size(); }

    bool stale() const noexcept { return stale_; }

protected:
    void Invalidate() noexcept { stale_ = true; }
    virtual SurfacePtr RenderImage() const = 0;

private:
    void Refresh();

    SurfacePtr image_;
    core::Point pos_{};
    core::Rect area_{};
    bool stale_ = true;
};

// A filled rectangle.
class SolidSprite : public Sprite {
public:
    SolidSprite(const core::Point& pos = {},
                const core::Size& size = {50, 50},
                const core::Color& color = {0, 0, 0, 255});

    const core::Size& surface_size() const noexcept { return size_; }
    void set_width(int value);
    void set_height(int value);
    void set_size(const core::Size& value);

    const core::Color& color() const noexcept { return color_; }
    void set_color(const core::Color& value);

protected:
    SurfacePtr RenderImage() const override;

private:
    core::Size size_;
    core::Color color_;
};

// An image file decoded with SDL_image.
class ImageSprite : public Sprite {
public:
    explicit ImageSprite(std::string path, const core::Point& pos = {});

    const std::string& path() const noexcept { return path_; }
    void set_path(const std::string& value);

protected:
    SurfacePtr RenderImage() const override;

private:
    std::string path_;
};

}  // namespace menukit::render
