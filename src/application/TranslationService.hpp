/**
 * @file TranslationService.hpp
 * @brief Layered translation resolution for the active locale.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/BaselineProvider.hpp"
#include "domain/SourceInfo.hpp"
#include "domain/TranslationEntry.hpp"

namespace langlens::application {

/**
 * @struct TranslationSnapshot
 * @brief Everything a refresh produces. Immutable once published.
 */
struct TranslationSnapshot {
    std::uint64_t version = 0;
    std::string locale;
    domain::TranslationTable table;
    std::vector<std::string> sortedKeys;          ///< Search order.
    std::vector<domain::SourceInfo> sources;
    std::vector<std::string> availableLocales;    ///< Sorted, unique.
};

/**
 * @class TranslationService
 * @brief Owns the merged table and answers lookups against it.
 *
 * Merge order on refresh: the baseline first, then every discovered pack in
 * discovery order, each overriding what came before. A failing source only
 * loses its own contribution.
 *
 * Readers never block on a refresh: the new table is built privately and
 * published with a single pointer swap. Refreshes are serialized.
 */
class TranslationService {
public:
    using Listener = std::function<void()>;
    using ListenerId = int;

    /**
     * @param baseline Provider of the default table; may be null.
     * @param locale Initial locale.
     */
    explicit TranslationService(std::shared_ptr<domain::BaselineProvider> baseline,
                                const std::string& locale = "en_US");

    /** @brief Sets the roots used by refresh(). Does not refresh. */
    void setRoots(const std::vector<std::string>& workspaceRoots,
                  const std::vector<std::string>& configuredRoots);

    /**
     * @brief Rebuilds the table from scratch and publishes it.
     * @param locale Locale to resolve.
     * @param baselineEnabled Whether the baseline contributes at all.
     * @param candidateRoots Workspace directories that may be packs.
     * @param configuredRoots User-configured pack directories ('~' allowed).
     * @return The newly published table.
     */
    domain::TranslationTable refresh(const std::string& locale,
                                     bool baselineEnabled,
                                     const std::vector<std::string>& candidateRoots,
                                     const std::vector<std::string>& configuredRoots);

    /** @brief Refresh with the stored locale, roots and the provider's enabled flag. */
    domain::TranslationTable refresh();

    /** @brief Switches locale and refreshes before returning. */
    void setLocale(const std::string& locale);

    std::optional<domain::TranslationEntry> lookup(const std::string& key) const;
    std::optional<std::string> lookupValue(const std::string& key) const;
    bool exists(const std::string& key) const;

    /**
     * @brief Case-insensitive substring search over keys and values.
     * Keys are visited in ascending order; stops after limit matches.
     */
    std::vector<domain::TranslationEntry> search(const std::string& query, int limit = 50) const;

    std::string getCurrentLocale() const;
    std::vector<std::string> getAvailableLocales() const;
    std::vector<domain::SourceInfo> getSources() const;
    domain::TranslationTable getAllTranslations() const;
    std::uint64_t version() const;

    /** @brief Current published state; never null. */
    std::shared_ptr<const TranslationSnapshot> snapshot() const;

    void setBaselineEnabled(bool enabled);
    bool isBaselineEnabled() const;

    /**
     * @brief Clears the baseline cache and refreshes.
     * @param locale Locale to drop, or nullopt for every cached locale.
     */
    void clearBaselineCache(const std::optional<std::string>& locale = std::nullopt);

    /** @brief Registers a callback fired once after each completed refresh. */
    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

private:
    std::shared_ptr<TranslationSnapshot> build(const std::string& locale,
                                               bool baselineEnabled,
                                               const std::vector<std::string>& candidateRoots,
                                               const std::vector<std::string>& configuredRoots);
    void publish(std::shared_ptr<TranslationSnapshot> next);
    void notifyListeners();

    std::shared_ptr<domain::BaselineProvider> m_baseline;

    // Settings used by refresh().
    std::string m_locale;
    std::vector<std::string> m_workspaceRoots;
    std::vector<std::string> m_configuredRoots;

    std::shared_ptr<const TranslationSnapshot> m_current;
    std::uint64_t m_nextVersion = 1;

    mutable std::mutex m_stateMutex;
    std::mutex m_refreshMutex;

    std::map<ListenerId, Listener> m_listeners;
    ListenerId m_nextListenerId = 1;
    std::mutex m_listenerMutex;
};

} // namespace langlens::application
