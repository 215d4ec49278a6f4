#include "menukit/core/MenuSpec.hpp"

#include <algorithm>

#include "menukit/core/AppConfig.hpp"

namespace menukit::core {

namespace {

Json OptionToJson(const OptionSpec& option) {
    Json json;
    json["id"] = option.id;
    json["message"] = option.message;
    json["color_onblur"] = ColorToJson(option.color_onblur);
    json["color_onfocus"] = ColorToJson(option.color_onfocus);
    if (option.background_onblur) {
        json["background_onblur"] = ColorToJson(*option.background_onblur);
    }
    if (option.background_onfocus) {
        json["background_onfocus"] = ColorToJson(*option.background_onfocus);
    }
    if (option.font_size > 0) {
        json["font_size"] = option.font_size;
    }
    return json;
}

OptionSpec OptionFromJson(const Json& json) {
    OptionSpec option;
    if (json.is_string()) {
        option.message = json.get<std::string>();
        option.id = option.message;
        return option;
    }
    if (json.contains("message") && json["message"].is_string()) {
        option.message = json["message"].get<std::string>();
    }
    option.id = option.message;
    if (json.contains("id") && json["id"].is_string()) {
        option.id = json["id"].get<std::string>();
    }
    if (json.contains("color_onblur")) {
        option.color_onblur = ColorFromJson(json["color_onblur"]).value_or(option.color_onblur);
    }
    if (json.contains("color_onfocus")) {
        option.color_onfocus = ColorFromJson(json["color_onfocus"]).value_or(option.color_onfocus);
    }
    if (json.contains("background_onblur")) {
        option.background_onblur = ColorFromJson(json["background_onblur"]);
    }
    if (json.contains("background_onfocus")) {
        option.background_onfocus = ColorFromJson(json["background_onfocus"]);
    }
    if (json.contains("font_size") && json["font_size"].is_number_integer()) {
        option.font_size = std::max(0, json["font_size"].get<int>());
    }
    return option;
}

}  // namespace

Json MenuSpec::ToJson() const {
    Json json;
    json["title"] = title;
    json["wrap"] = wrap;
    json["spacing"] = spacing;
    if (background) {
        json["background"] = ColorToJson(*background);
    }
    if (!background_image.empty()) {
        json["background_image"] = background_image;
    }
    json["options"] = Json::array();
    for (const auto& option : options) {
        json["options"].push_back(OptionToJson(option));
    }
    return json;
}

MenuSpec MenuSpec::FromJson(const Json& json) {
    MenuSpec spec;
    if (json.contains("title") && json["title"].is_string()) {
        spec.title = json["title"].get<std::string>();
    }
    if (json.contains("wrap") && json["wrap"].is_boolean()) {
        spec.wrap = json["wrap"].get<bool>();
    }
    if (json.contains("spacing") && json["spacing"].is_number_integer()) {
        spec.spacing = json["spacing"].get<int>();
    }
    if (json.contains("background")) {
        spec.background = ColorFromJson(json["background"]);
    }
    if (json.contains("background_image") && json["background_image"].is_string()) {
        spec.background_image = json["background_image"].get<std::string>();
    }
    if (json.contains("options") && json["options"].is_array()) {
        for (const auto& item : json["options"]) {
            spec.options.push_back(OptionFromJson(item));
        }
    }
    return spec;
}

MenuSpec MenuSpec::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace menukit::core
