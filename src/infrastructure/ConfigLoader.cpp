/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace langlens::infrastructure {

namespace {

void ReadString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

void ReadStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    out.clear();
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
}

} // namespace

EngineSettings ConfigLoader::Parse(const std::string& text) {
    EngineSettings settings;

    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] Settings root is not an object, using defaults" << std::endl;
            return settings;
        }

        ReadString(j, "defaultLanguage", settings.defaultLanguage);
        ReadStringList(j, "resourcePackPaths", settings.resourcePackPaths);
        ReadStringList(j, "workspaceRoots", settings.workspaceRoots);
        ReadString(j, "vanillaUrlTemplate", settings.vanillaUrlTemplate);
        ReadString(j, "cacheDirectory", settings.cacheDirectory);

        if (j.contains("useVanillaTranslations") && j["useVanillaTranslations"].is_boolean()) {
            settings.useVanillaTranslations = j["useVanillaTranslations"].get<bool>();
        }
        if (j.contains("fetchTimeoutSeconds") && j["fetchTimeoutSeconds"].is_number_integer()) {
            int timeout = j["fetchTimeoutSeconds"].get<int>();
            if (timeout > 0) settings.fetchTimeoutSeconds = timeout;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings: " << e.what() << std::endl;
        return EngineSettings{};
    }

    return settings;
}

EngineSettings ConfigLoader::Load(const std::string& configPath) {
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return EngineSettings{};
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return EngineSettings{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

bool ConfigLoader::SaveDefaultLanguage(const std::string& configPath, const std::string& language) {
    std::filesystem::path path(configPath);
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream f(path);
        auto existing = nlohmann::json::parse(f, nullptr, false);
        if (!existing.is_discarded() && existing.is_object()) {
            j = existing;
        }
    }

    j["defaultLanguage"] = language;

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream f(path);
        f << j.dump(4);
        return f.good();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
}

} // namespace langlens::infrastructure
