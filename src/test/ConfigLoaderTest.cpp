#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cstdlib>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace langlens::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    // Defaults.
    {
        auto settings = ConfigLoader::Load("/nonexistent/langlens/settings.json");
        assert(settings.defaultLanguage == "en_US");
        assert(settings.resourcePackPaths.empty());
        assert(settings.useVanillaTranslations);
        assert(settings.fetchTimeoutSeconds == 10);
        assert(settings.vanillaUrlTemplate.empty());
    }

    // Full file.
    {
        auto settings = ConfigLoader::Parse(R"({
            "defaultLanguage": "de_DE",
            "resourcePackPaths": ["~/packs/rp", "/opt/rp", 7],
            "workspaceRoots": ["/work"],
            "useVanillaTranslations": false,
            "vanillaUrlTemplate": "http://mirror/{locale}.lang",
            "cacheDirectory": "/tmp/cache",
            "fetchTimeoutSeconds": 3
        })");
        assert(settings.defaultLanguage == "de_DE");
        assert(settings.resourcePackPaths.size() == 2);
        assert(settings.resourcePackPaths[0] == "~/packs/rp");
        assert(settings.workspaceRoots.size() == 1);
        assert(!settings.useVanillaTranslations);
        assert(settings.vanillaUrlTemplate == "http://mirror/{locale}.lang");
        assert(settings.cacheDirectory == "/tmp/cache");
        assert(settings.fetchTimeoutSeconds == 3);
    }

    // Wrong types keep defaults; corrupt text falls back entirely.
    {
        auto settings = ConfigLoader::Parse(R"({"defaultLanguage": 1, "useVanillaTranslations": "no", "fetchTimeoutSeconds": -5})");
        assert(settings.defaultLanguage == "en_US");
        assert(settings.useVanillaTranslations);
        assert(settings.fetchTimeoutSeconds == 10);

        assert(ConfigLoader::Parse("{ nope").defaultLanguage == "en_US");
        assert(ConfigLoader::Parse("[]").defaultLanguage == "en_US");
    }

    // Saving the language keeps unrelated keys.
    {
        fs::path dir = fs::temp_directory_path() / "langlens_config_test";
        fs::remove_all(dir);
        fs::path file = dir / "nested" / "settings.json";

        assert(ConfigLoader::SaveDefaultLanguage(file.string(), "ja_JP"));
        assert(ConfigLoader::Load(file.string()).defaultLanguage == "ja_JP");

        {
            std::ofstream out(file);
            out << R"({"defaultLanguage":"en_US","resourcePackPaths":["/rp"]})";
        }
        assert(ConfigLoader::SaveDefaultLanguage(file.string(), "ko_KR"));
        auto settings = ConfigLoader::Load(file.string());
        assert(settings.defaultLanguage == "ko_KR");
        assert(settings.resourcePackPaths.size() == 1 && settings.resourcePackPaths[0] == "/rp");

        fs::remove_all(dir);
    }

    // Home expansion.
    {
        setenv("HOME", "/home/tester", 1);
        assert(PathUtils::ExpandHome("~/packs") == "/home/tester/packs");
        assert(PathUtils::ExpandHome("/abs/~/x") == "/abs/~/x");
        setenv("XDG_CONFIG_HOME", "/cfg", 1);
        assert(PathUtils::GetDefaultConfigPath() == fs::path("/cfg/langlens/settings.json"));
        setenv("XDG_CACHE_HOME", "/cache", 1);
        assert(PathUtils::GetDefaultBaselineCacheDir() == fs::path("/cache/langlens/vanilla-translations"));

        // Without XDG variables the home directory is used.
        setenv("XDG_CONFIG_HOME", "", 1);
        unsetenv("XDG_CACHE_HOME");
        assert(PathUtils::GetConfigHome() == fs::path("/home/tester/.config"));
        assert(PathUtils::GetCacheHome() == fs::path("/home/tester/.cache"));
    }

    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
