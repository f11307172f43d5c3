// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace promptwarden::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetModelsDir();
    /** @brief $XDG_CONFIG_HOME/PromptWarden/settings.json (may not exist). */
    static std::filesystem::path GetDefaultConfigPath();
    static std::filesystem::path GetDefaultAuditPath();
};

} // namespace promptwarden::infrastructure
