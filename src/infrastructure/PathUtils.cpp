#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace langlens::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "langlens";

// $<xdgVar>, else $HOME/<homeRelative>, else the working directory.
fs::path XdgDir(const char* xdgVar, const char* homeRelative) {
    const char* xdg = std::getenv(xdgVar);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}
}

fs::path PathUtils::GetConfigHome() {
    return XdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return XdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

fs::path PathUtils::GetDefaultBaselineCacheDir() {
    return GetCacheHome() / kAppDirName / "vanilla-translations";
}

std::string PathUtils::ExpandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "") + path.substr(1);
}

} // namespace langlens::infrastructure
