#pragma once

#include <optional>
#include <string>
#include <vector>

#include "menukit/core/Json.hpp"
#include "menukit/core/Types.hpp"

namespace menukit::core {

struct OptionSpec {
    std::string id;
    std::string message = "OPTION";
    Color color_onblur{0, 0, 0, 255};
    Color color_onfocus{255, 0, 0, 255};
    std::optional<Color> background_onblur;
    std::optional<Color> background_onfocus;
    // Zero keeps the application's default size.
    int font_size = 0;
};

// Declarative menu description, loaded from JSON data files.
struct MenuSpec {
    std::string title;
    std::vector<OptionSpec> options;
    bool wrap = false;
    int spacing = 0;
    std::optional<Color> background;
    std::string background_image;

    Json ToJson() const;
    static MenuSpec FromJson(const Json& json);

    static MenuSpec Deserialize(const std::string& json_string);
};

}  // namespace menukit::core
