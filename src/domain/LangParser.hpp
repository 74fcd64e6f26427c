#pragma once

#include "domain/TranslationEntry.hpp"
#include <string>

namespace langlens::domain {

/**
 * @brief Parser for the line-oriented key=value .lang format.
 * This service is stateless and never throws on malformed input.
 *
 * - Lines are trimmed; empty lines and lines starting with '#' are skipped.
 * - The line is split at the first '='; the value keeps any further '='.
 * - Lines without '=' or with an empty key are skipped.
 * - A key defined twice keeps the last definition.
 */
class LangParser {
public:
    /**
     * @brief Parses in-memory content.
     * @param content Raw file content.
     * @param provenance Stored as sourceLocation on every entry.
     */
    static TranslationTable Parse(const std::string& content, const std::string& provenance);

    /**
     * @brief Reads and parses a file. Missing or unreadable files yield an empty table.
     * @param filePath Path to the .lang file, also used as provenance.
     */
    static TranslationTable ParseFile(const std::string& filePath);

    /** @brief Rejects empty codes and codes that could escape a data directory. */
    static bool IsValidLocale(const std::string& locale);

    /** @brief "<locale>.lang" */
    static std::string FileNameFor(const std::string& locale);

    static constexpr const char* kExtension = ".lang";
};

} // namespace langlens::domain
