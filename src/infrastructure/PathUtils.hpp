// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace taskweave::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetAppDataDir();
    static std::filesystem::path GetAppConfigDir();
    static std::filesystem::path GetBlueprintsDir();
};

} // namespace taskweave::infrastructure
