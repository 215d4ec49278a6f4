#pragma once

#include <filesystem>
#include <string>

#include "menukit/core/AppConfig.hpp"

namespace menukit::platform {

// Reads and writes settings.json under the per-user preference directory.
class ConfigStore {
public:
    explicit ConfigStore(std::filesystem::path root);

    bool Initialize();

    // Defaults when the file is missing or unreadable.
    core::AppConfig Load() const;
    bool Save(const core::AppConfig& config);

    bool ReadText(const std::filesystem::path& path, std::string& out_text) const;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& settings_path() const { return settings_path_; }

private:
    bool EnsureRootExists() const;

    std::filesystem::path root_;
    std::filesystem::path settings_path_;
};

}  // namespace menukit::platform
