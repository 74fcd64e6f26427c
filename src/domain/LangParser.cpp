#include "domain/LangParser.hpp"
#include <fstream>
#include <sstream>
#include <iostream>

namespace langlens::domain {

namespace {
    constexpr const char* kWhitespace = " \t\r\n\f\v";
    constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

    void Trim(std::string& s) {
        if (s.empty()) return;
        s.erase(0, s.find_first_not_of(kWhitespace));
        if (!s.empty()) s.erase(s.find_last_not_of(kWhitespace) + 1);
    }

    bool StartsWith(const std::string& text, const char* prefix) {
        return text.compare(0, std::string(prefix).length(), prefix) == 0;
    }
}

TranslationTable LangParser::Parse(const std::string& content, const std::string& provenance) {
    TranslationTable table;

    std::stringstream ss(content);
    std::string line;
    int lineNumber = 0;

    while (std::getline(ss, line)) {
        ++lineNumber;
        if (lineNumber == 1 && StartsWith(line, kUtf8Bom)) {
            line.erase(0, 3);
        }
        Trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos || equalPos == 0) {
            continue;
        }

        TranslationEntry entry;
        entry.key = line.substr(0, equalPos);
        entry.value = line.substr(equalPos + 1);
        entry.sourceLocation = provenance;
        entry.lineNumber = lineNumber;

        table[entry.key] = std::move(entry);
    }

    return table;
}

TranslationTable LangParser::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        std::cerr << "[LangParser] Failed reading " << filePath << std::endl;
        return {};
    }
    return Parse(buffer.str(), filePath);
}

bool LangParser::IsValidLocale(const std::string& locale) {
    if (locale.empty()) return false;
    if (locale.find_first_of("/\\") != std::string::npos) return false;
    return locale.find("..") == std::string::npos;
}

std::string LangParser::FileNameFor(const std::string& locale) {
    return locale + kExtension;
}

} // namespace langlens::domain
