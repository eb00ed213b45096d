// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace reviewmemory::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Default snapshot directory: $XDG_DATA_HOME/ReviewMemory/memory. */
    static std::filesystem::path GetMemoryDir();

    /** @brief Default settings file: $XDG_CONFIG_HOME/ReviewMemory/settings.json. */
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace reviewmemory::infrastructure
