/**
 * @file SourceInfo.hpp
 * @brief Domain entity describing a discovered resource pack.
 */

#pragma once
#include <string>
#include <vector>

namespace langlens::domain {

/**
 * @class SourceInfo
 * @brief An override source found on disk. Identity is the root path.
 */
class SourceInfo {
public:
    std::string rootPath;        ///< Directory holding manifest.json.
    std::string displayName;     ///< header.name, or the directory name.
    bool hasOverrideData;        ///< True if dataPath exists.
    std::string dataPath;        ///< <rootPath>/texts, whether or not it exists.

    SourceInfo() : hasOverrideData(false) {}
};

/**
 * @struct PackManifest
 * @brief The parts of manifest.json that discovery cares about.
 */
struct PackManifest {
    std::string headerName;          ///< Empty when absent.
    std::vector<std::string> moduleTypes;

    bool declaresResources() const {
        for (const auto& type : moduleTypes) {
            if (type == "resources") return true;
        }
        return false;
    }
};

} // namespace langlens::domain
