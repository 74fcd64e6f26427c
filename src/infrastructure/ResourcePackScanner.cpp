/**
 * @file ResourcePackScanner.cpp
 * @brief Implementation of the ResourcePackScanner.
 */

#include "infrastructure/ResourcePackScanner.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/LangParser.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace langlens::infrastructure {

std::optional<domain::PackManifest> ResourcePackScanner::ParseManifest(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    domain::PackManifest manifest;
    if (j.contains("header") && j["header"].is_object()) {
        const auto& header = j["header"];
        if (header.contains("name") && header["name"].is_string()) {
            manifest.headerName = header["name"].get<std::string>();
        }
    }

    if (j.contains("modules") && j["modules"].is_array()) {
        for (const auto& module : j["modules"]) {
            if (module.is_object() && module.contains("type") && module["type"].is_string()) {
                manifest.moduleTypes.push_back(module["type"].get<std::string>());
            }
        }
    }
    return manifest;
}

std::vector<domain::SourceInfo> ResourcePackScanner::ScanRoot(const std::string& rootPath) {
    std::vector<domain::SourceInfo> packs;
    std::error_code ec;

    fs::path manifestPath = fs::path(rootPath) / kManifestFile;
    if (!fs::is_regular_file(manifestPath, ec)) {
        return packs;
    }

    std::ifstream f(manifestPath);
    if (!f.is_open()) {
        return packs;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    auto manifest = ParseManifest(buffer.str());
    if (!manifest || !manifest->declaresResources()) {
        return packs;
    }

    fs::path textsPath = fs::path(rootPath) / kTextsDir;

    domain::SourceInfo info;
    info.rootPath = rootPath;
    info.displayName = manifest->headerName.empty() ? fallbackName(rootPath) : manifest->headerName;
    info.dataPath = textsPath.string();
    info.hasOverrideData = fs::exists(textsPath, ec);
    packs.push_back(info);

    return packs;
}

std::vector<domain::SourceInfo> ResourcePackScanner::Discover(const std::vector<std::string>& candidateRoots) {
    std::vector<domain::SourceInfo> result;
    std::unordered_set<std::string> seen;

    for (const auto& root : candidateRoots) {
        for (auto& pack : ScanRoot(root)) {
            if (!seen.insert(pack.rootPath).second) continue;
            result.push_back(std::move(pack));
        }
    }
    return result;
}

std::vector<domain::SourceInfo> ResourcePackScanner::DiscoverAll(const std::vector<std::string>& workspaceRoots,
                                                                 const std::vector<std::string>& configuredRoots) {
    std::vector<std::string> candidates = workspaceRoots;

    for (const auto& configured : configuredRoots) {
        std::string expanded = PathUtils::ExpandHome(configured);
        std::error_code ec;
        if (!fs::exists(expanded, ec)) continue;
        candidates.push_back(expanded);
    }

    return Discover(candidates);
}

std::vector<std::string> ResourcePackScanner::ListLocales(const std::string& dataPath) {
    std::vector<std::string> locales;
    std::error_code ec;
    if (!fs::is_directory(dataPath, ec)) {
        return locales;
    }

    const std::string ext = domain::LangParser::kExtension;
    for (fs::directory_iterator it(dataPath, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        std::string name = it->path().filename().string();
        if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
            continue;
        }
        locales.push_back(name.substr(0, name.size() - ext.size()));
    }

    std::sort(locales.begin(), locales.end());
    return locales;
}

std::string ResourcePackScanner::fallbackName(const std::string& rootPath) {
    fs::path p(rootPath);
    if (!p.has_filename()) p = p.parent_path();
    return p.filename().string();
}

} // namespace langlens::infrastructure
