#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace editalflow::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "EditalFlow" / "settings.json";
}

} // namespace editalflow::infrastructure
