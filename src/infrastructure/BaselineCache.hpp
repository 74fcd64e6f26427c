/**
 * @file BaselineCache.hpp
 * @brief Remote baseline translations with a 24h on-disk recovery cache.
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/BaselineProvider.hpp"
#include "domain/RemoteFetcher.hpp"

namespace langlens::infrastructure {

/**
 * @enum CacheStatus
 * @brief Freshness of the persisted copy of one locale.
 */
enum class CacheStatus {
    Fresh,
    Stale,
    Absent
};

/**
 * @enum LoadOutcome
 * @brief Which branch produced the table returned by BaselineCache::load.
 */
enum class LoadOutcome {
    Disabled,
    InvalidLocale,
    CacheHit,
    Refreshed,
    StaleFallback,
    ColdMiss
};

/**
 * @struct CacheMetadata
 * @brief Contents of <locale>.meta.json.
 */
struct CacheMetadata {
    std::int64_t fetchedAt = 0; ///< Epoch milliseconds.
    std::string version;
};

/**
 * @brief Decides freshness from what is on disk.
 * @param contentExists Whether <locale>.lang is present.
 * @param metadata Decoded metadata, nullopt if missing or unparseable.
 */
CacheStatus EvaluateCacheStatus(bool contentExists,
                                const std::optional<CacheMetadata>& metadata,
                                std::int64_t nowMillis,
                                std::int64_t windowMillis);

/**
 * @class BaselineCache
 * @brief Serves the vanilla baseline: fresh cache, else network, else stale cache, else nothing.
 *
 * Never throws from load. The caller is never left without data when any
 * cached copy exists for the requested locale.
 */
class BaselineCache : public domain::BaselineProvider {
public:
    using Clock = std::function<std::int64_t()>;

    static constexpr std::int64_t kFreshnessWindowMillis = 24LL * 60 * 60 * 1000;
    static constexpr const char* kDefaultUrlTemplate =
        "https://raw.githubusercontent.com/ZtechNetwork/MCBVanillaResourcePack/master/texts/{locale}.lang";
    static constexpr const char* kMetadataVersion = "1.0";

    /**
     * @param cacheDir Directory holding <locale>.lang and <locale>.meta.json. Created if missing.
     * @param fetcher Transport for the remote endpoint.
     * @param urlTemplate Endpoint with a "{locale}" placeholder.
     * @param clock Epoch-millisecond clock; system clock when empty.
     */
    BaselineCache(const std::string& cacheDir,
                  std::shared_ptr<domain::RemoteFetcher> fetcher,
                  const std::string& urlTemplate = kDefaultUrlTemplate,
                  Clock clock = {});

    domain::TranslationTable loadTranslations(const std::string& locale) override;
    std::vector<std::string> getAvailableLanguages() const override;
    void clearCache(const std::optional<std::string>& locale) override;
    bool isEnabled() const override { return m_enabled; }
    void setEnabled(bool enabled) override { m_enabled = enabled; }

    /** @brief Same as loadTranslations but also reports the branch taken. */
    std::pair<domain::TranslationTable, LoadOutcome> load(const std::string& locale);

    /** @brief Clears one locale and loads it again. */
    domain::TranslationTable forceRefresh(const std::string& locale);

    /** @brief Freshness of the persisted copy of locale at the current clock time. */
    CacheStatus status(const std::string& locale) const;

    std::string urlFor(const std::string& locale) const;
    std::string getCachePath(const std::string& locale) const;
    std::string getMetadataPath(const std::string& locale) const;
    const std::string& cacheDir() const { return m_cacheDir; }

    /** @brief Provenance stored on baseline entries. */
    static std::string ProvenanceFor(const std::string& locale);

private:
    void ensureCacheDir() const;
    std::optional<CacheMetadata> readMetadata(const std::string& locale) const;
    std::optional<std::string> readFromCache(const std::string& locale) const;
    bool writeToCache(const std::string& locale, const std::string& content) const;

    std::string m_cacheDir;
    std::shared_ptr<domain::RemoteFetcher> m_fetcher;
    std::string m_urlTemplate;
    Clock m_clock;
    std::atomic<bool> m_enabled{true};
};

} // namespace langlens::infrastructure
