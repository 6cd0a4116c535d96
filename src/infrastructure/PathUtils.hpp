// PathUtils Header
#pragma once
#include <filesystem>
#include <string>

namespace ledgerlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/LedgerLens, created on demand. */
    static std::filesystem::path GetAppDataDir();

    /** @brief $XDG_CONFIG_HOME/LedgerLens/settings.json (may not exist). */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace ledgerlens::infrastructure
