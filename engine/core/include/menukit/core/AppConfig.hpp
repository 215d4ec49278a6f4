#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "menukit/core/Json.hpp"
#include "menukit/core/ScreenFlags.hpp"
#include "menukit/core/Types.hpp"

namespace menukit::core {

inline constexpr int kDefaultMainRate = 120;
inline constexpr int kDefaultMenuRate = 30;
inline constexpr double kDefaultRepeatDelay = 0.233;

struct ScreenConfig {
    std::array<int, 2> size{{800, 600}};
    Color color{255, 255, 255, 255};
    std::string title = "menukit window";
    ScreenFlags flags{};
};

// Key bindings by backend key name, as reported in KeyDown events.
struct MenuBindings {
    std::vector<std::string> previous = {"Up"};
    std::vector<std::string> next = {"Down"};
    std::vector<std::string> confirm = {"Return", "Keypad Enter", "Space"};
};

struct AppConfig {
    ScreenConfig screen{};
    int main_rate = kDefaultMainRate;
    int menu_rate = kDefaultMenuRate;
    double repeat_delay = kDefaultRepeatDelay;
    MenuBindings bindings{};
    std::string font_file;
    int font_size = 84;

    Json ToJson() const;
    static AppConfig FromJson(const Json& json);

    std::string Serialize() const;
    static AppConfig Deserialize(const std::string& json_string);
};

Json ColorToJson(const Color& color);
// Reads [r, g, b] or [r, g, b, a]; anything else yields nothing.
std::optional<Color> ColorFromJson(const Json& json);

}  // namespace menukit::core
