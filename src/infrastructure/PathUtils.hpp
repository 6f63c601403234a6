// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace noteagent::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetAppConfigDir();
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace noteagent::infrastructure
