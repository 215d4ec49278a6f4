#pragma once

#include <optional>
#include <string>

#include "menukit/core/Types.hpp"
#include "menukit/render/FontCache.hpp"
#include "menukit/render/Sprite.hpp"

namespace menukit::render {

struct TextStyle {
    std::string font_file;
    int font_size = 84;
    bool antialias = true;
    core::Color message_color{0, 0, 0, 255};
    std::optional<core::Color> background_color;
};

// A single line of rasterized text. Without a font (SDL_ttf not running) the
// image is empty and the area has zero size.
class Text : public Sprite {
public:
    Text(FontCache& fonts,
         std::string message = "TEXT",
         TextStyle style = {},
         const core::Point& pos = {});

    const std::string& message() const noexcept { return message_; }
    void set_message(const std::string& value);

    const std::string& font_file() const noexcept { return style_.font_file; }
    void set_font_file(const std::string& value);
    int font_size() const noexcept { return style_.font_size; }
    void set_font_size(int value);
    bool antialias() const noexcept { return style_.antialias; }
    void set_antialias(bool value);

    const core::Color& message_color() const noexcept { return style_.message_color; }
    void set_message_color(const core::Color& value);
    const std::optional<core::Color>& background_color() const noexcept {
        return style_.background_color;
    }
    void set_background_color(const std::optional<core::Color>& value);

    const TextStyle& style() const noexcept { return style_; }

protected:
    SurfacePtr RenderImage() const override;

private:
    FontCache* fonts_;
    std::string message_;
    TextStyle style_;
};

}  // namespace menukit::render
