#include "menukit/core/AppConfig.hpp"

#include <algorithm>
#include <cstdint>

namespace menukit::core {

namespace {

std::vector<std::string> StringList(const Json& json, const std::vector<std::string>& fallback) {
    if (!json.is_array()) {
        return fallback;
    }
    std::vector<std::string> values;
    for (const auto& item : json) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

Json ScreenToJson(const ScreenConfig& screen) {
    Json json;
    json["size"] = {screen.size[0], screen.size[1]};
    json["color"] = ColorToJson(screen.color);
    json["title"] = screen.title;
    json["flags"] = screen.flags.Names();
    return json;
}

ScreenConfig ScreenFromJson(const Json& json) {
    ScreenConfig screen;
    if (json.contains("size") && json["size"].is_array() && json["size"].size() == 2) {
        const auto& size = json["size"];
        if (size[0].is_number_integer() && size[1].is_number_integer()) {
            screen.size[0] = std::max(1, size[0].get<int>());
            screen.size[1] = std::max(1, size[1].get<int>());
        }
    }
    if (json.contains("color")) {
        if (auto color = ColorFromJson(json["color"])) {
            screen.color = *color;
        }
    }
    if (json.contains("title") && json["title"].is_string()) {
        screen.title = json["title"].get<std::string>();
    }
    if (json.contains("flags") && json["flags"].is_array()) {
        // Unknown names are skipped.
        for (const auto& name : StringList(json["flags"], {})) {
            screen.flags.Set(name);
        }
    }
    return screen;
}

}  // namespace

Json ColorToJson(const Color& color) {
    if (color.a == 255) {
        return Json::array({color.r, color.g, color.b});
    }
    return Json::array({color.r, color.g, color.b, color.a});
}

std::optional<Color> ColorFromJson(const Json& json) {
    if (!json.is_array() || (json.size() != 3 && json.size() != 4)) {
        return std::nullopt;
    }
    std::array<std::uint8_t, 4> channels{{0, 0, 0, 255}};
    for (std::size_t i = 0; i < json.size(); ++i) {
        if (!json[i].is_number_integer()) {
            return std::nullopt;
        }
        channels[i] = static_cast<std::uint8_t>(std::clamp(json[i].get<int>(), 0, 255));
    }
    return Color{channels[0], channels[1], channels[2], channels[3]};
}

Json AppConfig::ToJson() const {
    Json json;
    json["screen"] = ScreenToJson(screen);
    json["main_rate"] = main_rate;
    json["menu_rate"] = menu_rate;
    json["repeat_delay"] = repeat_delay;
    json["bindings"]["previous"] = bindings.previous;
    json["bindings"]["next"] = bindings.next;
    json["bindings"]["confirm"] = bindings.confirm;
    json["font_file"] = font_file;
    json["font_size"] = font_size;
    return json;
}

AppConfig AppConfig::FromJson(const Json& json) {
    AppConfig config;
    if (json.contains("screen") && json["screen"].is_object()) {
        config.screen = ScreenFromJson(json["screen"]);
    }
    if (json.contains("main_rate") && json["main_rate"].is_number_integer()) {
        config.main_rate = std::max(1, json["main_rate"].get<int>());
    }
    if (json.contains("menu_rate") && json["menu_rate"].is_number_integer()) {
        config.menu_rate = std::max(1, json["menu_rate"].get<int>());
    }
    if (json.contains("repeat_delay") && json["repeat_delay"].is_number()) {
        config.repeat_delay = std::max(0.0, json["repeat_delay"].get<double>());
    }
    if (json.contains("bindings") && json["bindings"].is_object()) {
        const auto& bindings = json["bindings"];
        if (bindings.contains("previous")) {
            config.bindings.previous = StringList(bindings["previous"], config.bindings.previous);
        }
        if (bindings.contains("next")) {
            config.bindings.next = StringList(bindings["next"], config.bindings.next);
        }
        if (bindings.contains("confirm")) {
            config.bindings.confirm = StringList(bindings["confirm"], config.bindings.confirm);
        }
    }
    if (json.contains("font_file") && json["font_file"].is_string()) {
        config.font_file = json["font_file"].get<std::string>();
    }
    if (json.contains("font_size") && json["font_size"].is_number_integer()) {
        config.font_size = std::max(1, json["font_size"].get<int>());
    }
    return config;
}

std::string AppConfig::Serialize() const {
    return ToJson().dump(2);
}

AppConfig AppConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace menukit::core
