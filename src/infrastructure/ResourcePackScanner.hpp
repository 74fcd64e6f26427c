/**
 * @file ResourcePackScanner.hpp
 * @brief Discovery of resource packs that override baseline translations.
 */

#pragma once
#include <vector>
#include <string>
#include <optional>
#include "domain/SourceInfo.hpp"

namespace langlens::infrastructure {

/**
 * @class ResourcePackScanner
 * @brief Infrastructure adapter that recognises resource pack roots on disk.
 *
 * Only the candidate directory itself is inspected; subdirectories are never
 * searched for nested packs.
 */
class ResourcePackScanner {
public:
    static constexpr const char* kManifestFile = "manifest.json";
    static constexpr const char* kTextsDir = "texts";

    /**
     * @brief Decodes manifest.json content.
     * @return nullopt if the text is not a JSON object. Never throws.
     */
    static std::optional<domain::PackManifest> ParseManifest(const std::string& text);

    /**
     * @brief Checks a single directory.
     * @return One SourceInfo if the root holds a resources manifest, otherwise empty.
     */
    static std::vector<domain::SourceInfo> ScanRoot(const std::string& rootPath);

    /** @brief Scans every root in order, dropping repeated root paths. */
    static std::vector<domain::SourceInfo> Discover(const std::vector<std::string>& candidateRoots);

    /**
     * @brief Workspace roots first, then configured roots.
     * Configured roots get '~' expansion and are skipped when missing.
     * The first SourceInfo seen for a root path wins.
     */
    static std::vector<domain::SourceInfo> DiscoverAll(const std::vector<std::string>& workspaceRoots,
                                                       const std::vector<std::string>& configuredRoots);

    /** @brief Locale codes of the .lang files in dataPath, sorted. */
    static std::vector<std::string> ListLocales(const std::string& dataPath);

private:
    static std::string fallbackName(const std::string& rootPath);
};

} // namespace langlens::infrastructure
