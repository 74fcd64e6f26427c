/**
 * @file TranslationEntry.hpp
 * @brief Value types for resolved translation keys.
 */

#pragma once
#include <string>
#include <unordered_map>

namespace langlens::domain {

/**
 * @struct TranslationEntry
 * @brief One resolved key with the place it was defined.
 */
struct TranslationEntry {
    std::string key;
    std::string value;
    std::string sourceLocation; ///< File path, or "vanilla:<locale>" for the remote baseline.
    int lineNumber = 0;         ///< 1-indexed.
};

/**
 * @brief Flattened key -> entry table for a single locale.
 */
using TranslationTable = std::unordered_map<std::string, TranslationEntry>;

} // namespace langlens::domain
