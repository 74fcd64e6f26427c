/**
 * @file BaselineCache.cpp
 * @brief Implementation of BaselineCache.
 */

#include "infrastructure/BaselineCache.hpp"
#include "domain/LangParser.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace langlens::infrastructure {

namespace {

constexpr const char* kLocalePlaceholder = "{locale}";

std::int64_t SystemNowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Whole-file replace through a temp file so readers never see a half-written file.
bool AtomicWriteFile(const fs::path& finalPath, const std::string& content) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[BaselineCache] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[BaselineCache] Write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[BaselineCache] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace

CacheStatus EvaluateCacheStatus(bool contentExists,
                                const std::optional<CacheMetadata>& metadata,
                                std::int64_t nowMillis,
                                std::int64_t windowMillis) {
    if (!contentExists) {
        return CacheStatus::Absent;
    }
    if (!metadata) {
        return CacheStatus::Stale;
    }
    // A timestamp from the future, or a window reaching below the int64 range, is not trusted.
    if (metadata->fetchedAt > nowMillis ||
        nowMillis < std::numeric_limits<std::int64_t>::min() + windowMillis) {
        return CacheStatus::Stale;
    }
    return metadata->fetchedAt > nowMillis - windowMillis ? CacheStatus::Fresh : CacheStatus::Stale;
}

BaselineCache::BaselineCache(const std::string& cacheDir,
                             std::shared_ptr<domain::RemoteFetcher> fetcher,
                             const std::string& urlTemplate,
                             Clock clock)
    : m_cacheDir(cacheDir),
      m_fetcher(std::move(fetcher)),
      m_urlTemplate(urlTemplate),
      m_clock(clock ? std::move(clock) : Clock(SystemNowMillis)) {
    ensureCacheDir();
}

void BaselineCache::ensureCacheDir() const {
    std::error_code ec;
    fs::create_directories(m_cacheDir, ec);
    if (ec) {
        std::cerr << "[BaselineCache] Error creating cache directory " << m_cacheDir << ": " << ec.message() << std::endl;
    }
}

std::string BaselineCache::ProvenanceFor(const std::string& locale) {
    return "vanilla:" + locale;
}

std::string BaselineCache::urlFor(const std::string& locale) const {
    std::string url = m_urlTemplate;
    const std::string placeholder = kLocalePlaceholder;
    size_t pos = url.find(placeholder);
    if (pos == std::string::npos) {
        return url + "/" + domain::LangParser::FileNameFor(locale);
    }
    while (pos != std::string::npos) {
        url.replace(pos, placeholder.size(), locale);
        pos = url.find(placeholder, pos + locale.size());
    }
    return url;
}

std::string BaselineCache::getCachePath(const std::string& locale) const {
    return (fs::path(m_cacheDir) / domain::LangParser::FileNameFor(locale)).string();
}

std::string BaselineCache::getMetadataPath(const std::string& locale) const {
    return (fs::path(m_cacheDir) / (locale + ".meta.json")).string();
}

std::optional<CacheMetadata> BaselineCache::readMetadata(const std::string& locale) const {
    std::ifstream f(getMetadataPath(locale));
    if (!f.is_open()) {
        return std::nullopt;
    }

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("fetchedAt") || !j["fetchedAt"].is_number_integer()) {
        return std::nullopt;
    }
    if (j["fetchedAt"].is_number_unsigned() &&
        j["fetchedAt"].get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }

    CacheMetadata meta;
    meta.fetchedAt = j["fetchedAt"].get<std::int64_t>();
    if (j.contains("version") && j["version"].is_string()) {
        meta.version = j["version"].get<std::string>();
    }
    return meta;
}

std::optional<std::string> BaselineCache::readFromCache(const std::string& locale) const {
    std::ifstream f(getCachePath(locale), std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool BaselineCache::writeToCache(const std::string& locale, const std::string& content) const {
    ensureCacheDir();

    json meta = {
        {"fetchedAt", m_clock()},
        {"version", kMetadataVersion}
    };

    return AtomicWriteFile(getCachePath(locale), content)
        && AtomicWriteFile(getMetadataPath(locale), meta.dump(4));
}

CacheStatus BaselineCache::status(const std::string& locale) const {
    std::error_code ec;
    bool contentExists = fs::is_regular_file(getCachePath(locale), ec);
    return EvaluateCacheStatus(contentExists, readMetadata(locale), m_clock(), kFreshnessWindowMillis);
}

std::pair<domain::TranslationTable, LoadOutcome> BaselineCache::load(const std::string& locale) {
    if (!m_enabled) {
        return {{}, LoadOutcome::Disabled};
    }
    if (!domain::LangParser::IsValidLocale(locale)) {
        std::cerr << "[BaselineCache] Ignoring invalid locale code '" << locale << "'" << std::endl;
        return {{}, LoadOutcome::InvalidLocale};
    }

    const std::string provenance = ProvenanceFor(locale);

    if (status(locale) == CacheStatus::Fresh) {
        auto cached = readFromCache(locale);
        if (cached && !cached->empty()) {
            auto table = domain::LangParser::Parse(*cached, provenance);
            std::cout << "[BaselineCache] Loaded " << table.size() << " entries for " << locale << " from cache" << std::endl;
            return {std::move(table), LoadOutcome::CacheHit};
        }
    }

    std::optional<std::string> content;
    if (m_fetcher) {
        std::cout << "[BaselineCache] Fetching baseline translations for " << locale << "..." << std::endl;
        try {
            content = m_fetcher->fetch(urlFor(locale));
        } catch (const std::exception& e) {
            std::cerr << "[BaselineCache] Fetch error: " << e.what() << std::endl;
            content.reset();
        }
    }

    if (content) {
        if (!writeToCache(locale, *content)) {
            std::cerr << "[BaselineCache] Could not persist baseline for " << locale << std::endl;
        }
        auto table = domain::LangParser::Parse(*content, provenance);
        std::cout << "[BaselineCache] Fetched and cached " << table.size() << " entries for " << locale << std::endl;
        return {std::move(table), LoadOutcome::Refreshed};
    }

    std::cerr << "[BaselineCache] Could not fetch baseline translations for " << locale << std::endl;

    auto stale = readFromCache(locale);
    if (stale && !stale->empty()) {
        std::cout << "[BaselineCache] Using stale cache for " << locale << std::endl;
        return {domain::LangParser::Parse(*stale, provenance), LoadOutcome::StaleFallback};
    }

    return {{}, LoadOutcome::ColdMiss};
}

domain::TranslationTable BaselineCache::loadTranslations(const std::string& locale) {
    return load(locale).first;
}

domain::TranslationTable BaselineCache::forceRefresh(const std::string& locale) {
    clearCache(locale);
    return loadTranslations(locale);
}

void BaselineCache::clearCache(const std::optional<std::string>& locale) {
    std::error_code ec;

    if (locale) {
        if (!domain::LangParser::IsValidLocale(*locale)) return;
        fs::remove(getCachePath(*locale), ec);
        if (ec) std::cerr << "[BaselineCache] Error removing " << getCachePath(*locale) << ": " << ec.message() << std::endl;
        fs::remove(getMetadataPath(*locale), ec);
        if (ec) std::cerr << "[BaselineCache] Error removing " << getMetadataPath(*locale) << ": " << ec.message() << std::endl;
        return;
    }

    if (!fs::is_directory(m_cacheDir, ec)) return;

    std::vector<fs::path> files;
    for (fs::directory_iterator it(m_cacheDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    for (const auto& file : files) {
        fs::remove(file, ec);
        if (ec) std::cerr << "[BaselineCache] Error removing " << file << ": " << ec.message() << std::endl;
    }
}

std::vector<std::string> BaselineCache::getAvailableLanguages() const {
    // The remote store cannot be listed, so these are the well-known codes.
    return {
        "en_US", "en_GB", "de_DE", "es_ES", "es_MX", "fr_FR", "fr_CA",
        "it_IT", "ja_JP", "ko_KR", "nl_NL", "pl_PL", "pt_BR", "pt_PT",
        "ru_RU", "zh_CN", "zh_TW", "tr_TR", "uk_UA", "ar_SA", "bg_BG",
        "cs_CZ", "da_DK", "el_GR", "fi_FI", "hu_HU", "id_ID", "nb_NO",
        "ro_RO", "sk_SK", "sv_SE", "th_TH", "vi_VN"
    };
}

} // namespace langlens::infrastructure
