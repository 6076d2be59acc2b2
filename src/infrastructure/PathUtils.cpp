#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace taskweave::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* kAppDirName = "taskweave";

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / kAppDirName;
}

fs::path PathUtils::GetAppConfigDir() {
    return GetConfigHome() / kAppDirName;
}

// Not created here; the blueprint store creates it on first save.
fs::path PathUtils::GetBlueprintsDir() {
    return GetAppDataDir() / "blueprints";
}

} // namespace taskweave::infrastructure
