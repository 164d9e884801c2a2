// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace editalflow::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    /** @brief <config home>/EditalFlow/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace editalflow::infrastructure
