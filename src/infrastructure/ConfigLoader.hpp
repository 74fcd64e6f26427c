/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Provides a unified way to access settings like the default language and
 * extra resource pack paths without scattering JSON parsing logic throughout
 * the codebase.
 */

#pragma once

#include <string>
#include <vector>

namespace langlens::infrastructure {

/**
 * @struct EngineSettings
 * @brief Every tunable of the resolution engine, with its default.
 */
struct EngineSettings {
    std::string defaultLanguage = "en_US";
    std::vector<std::string> resourcePackPaths;
    std::vector<std::string> workspaceRoots;
    bool useVanillaTranslations = true;
    std::string vanillaUrlTemplate;   ///< Empty means the built-in endpoint.
    std::string cacheDirectory;       ///< Empty means the XDG cache location.
    int fetchTimeoutSeconds = 10;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Defaults for a missing or corrupt file; keys of the wrong type keep their default.
     */
    static EngineSettings Load(const std::string& configPath);

    /** @brief Decodes settings from JSON text. Same fallback rules as Load. */
    static EngineSettings Parse(const std::string& text);

    /**
     * @brief Saves the 'defaultLanguage' key, preserving other keys if possible.
     * @return False if the file could not be written.
     */
    static bool SaveDefaultLanguage(const std::string& configPath, const std::string& language);
};

} // namespace langlens::infrastructure
