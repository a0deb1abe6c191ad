// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace archlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    /** @brief $XDG_CONFIG_HOME/ArchLens/settings.json (or ~/.config/...). */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace archlens::infrastructure
