/**
 * @file PathUtils.hpp
 * @brief XDG base directories and home expansion for settings and cache files.
 */

#pragma once
#include <string>
#include <filesystem>

namespace langlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
    /** @brief $XDG_CONFIG_HOME/langlens/settings.json */
    static std::filesystem::path GetDefaultConfigPath();
    /** @brief $XDG_CACHE_HOME/langlens/vanilla-translations */
    static std::filesystem::path GetDefaultBaselineCacheDir();
    /** @brief Replaces a leading '~' with $HOME. */
    static std::string ExpandHome(const std::string& path);
};

} // namespace langlens::infrastructure
