#include "menukit/platform/ConfigStore.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace menukit::platform {

namespace {

std::filesystem::path DefaultConfigRoot() {
    std::filesystem::path base;
    if (char* raw = SDL_GetPrefPath("menukit", "demo")) {
        base = raw;
        SDL_free(raw);
    }
    if (base.empty()) {
        base = std::filesystem::current_path() / "config";
    }
    return base;
}

}  // namespace

ConfigStore::ConfigStore(std::filesystem::path root)
    : root_(root.empty() ? DefaultConfigRoot() : std::move(root)) {
    settings_path_ = root_ / "settings.json";
}

bool ConfigStore::Initialize() {
    return EnsureRootExists();
}

bool ConfigStore::EnsureRootExists() const {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return true;
    }
    return std::filesystem::create_directories(root_, ec);
}

bool ConfigStore::ReadText(const std::filesystem::path& path, std::string& out_text) const {
    std::ifstream in(path);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out_text = buffer.str();
    return !in.bad();
}

core::AppConfig ConfigStore::Load() const {
    std::string text;
    if (!ReadText(settings_path_, text)) {
        return core::AppConfig{};
    }
    try {
        return core::AppConfig::Deserialize(text);
    } catch (const std::exception& ex) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring %s: %s",
                    settings_path_.string().c_str(), ex.what());
        return core::AppConfig{};
    }
}

bool ConfigStore::Save(const core::AppConfig& config) {
    if (!EnsureRootExists()) {
        return false;
    }
    std::ofstream out(settings_path_, std::ios::trunc);
    if (!out) {
        return false;
    }
    out << config.Serialize() << '\n';
    return out.good();
}

}  // namespace menukit::platform
