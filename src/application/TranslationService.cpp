/**
 * @file TranslationService.cpp
 * @brief Implementation of TranslationService.
 */

#include "application/TranslationService.hpp"
#include "domain/LangParser.hpp"
#include "infrastructure/ResourcePackScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace langlens::application {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

} // namespace

TranslationService::TranslationService(std::shared_ptr<domain::BaselineProvider> baseline,
                                       const std::string& locale)
    : m_baseline(std::move(baseline)),
      m_locale(locale),
      m_current(std::make_shared<TranslationSnapshot>()) {}

void TranslationService::setRoots(const std::vector<std::string>& workspaceRoots,
                                  const std::vector<std::string>& configuredRoots) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_workspaceRoots = workspaceRoots;
    m_configuredRoots = configuredRoots;
}

std::shared_ptr<TranslationSnapshot> TranslationService::build(const std::string& locale,
                                                               bool baselineEnabled,
                                                               const std::vector<std::string>& candidateRoots,
                                                               const std::vector<std::string>& configuredRoots) {
    auto next = std::make_shared<TranslationSnapshot>();
    next->locale = locale;
    std::set<std::string> allLocales;

    // Baseline first; packs layer on top of it.
    if (m_baseline) {
        try {
            if (baselineEnabled) {
                next->table = m_baseline->loadTranslations(locale);
                std::cout << "[TranslationService] Loaded " << next->table.size() << " baseline translations" << std::endl;
            }
            for (const auto& lang : m_baseline->getAvailableLanguages()) {
                allLocales.insert(lang);
            }
        } catch (const std::exception& e) {
            std::cerr << "[TranslationService] Failed to load baseline translations: " << e.what() << std::endl;
            next->table.clear();
        }
    }

    try {
        next->sources = infrastructure::ResourcePackScanner::DiscoverAll(candidateRoots, configuredRoots);
    } catch (const std::exception& e) {
        std::cerr << "[TranslationService] Resource pack discovery failed: " << e.what() << std::endl;
        next->sources.clear();
    }

    const bool localeUsable = domain::LangParser::IsValidLocale(locale);

    for (const auto& pack : next->sources) {
        if (!pack.hasOverrideData) continue;

        try {
            for (const auto& lang : infrastructure::ResourcePackScanner::ListLocales(pack.dataPath)) {
                allLocales.insert(lang);
            }
            if (!localeUsable) continue;

            fs::path langFile = fs::path(pack.dataPath) / domain::LangParser::FileNameFor(locale);
            auto packTable = domain::LangParser::ParseFile(langFile.string());
            for (auto& [key, entry] : packTable) {
                next->table[key] = std::move(entry);
            }
        } catch (const std::exception& e) {
            std::cerr << "[TranslationService] Skipping pack " << pack.displayName << ": " << e.what() << std::endl;
        }
    }

    next->availableLocales.assign(allLocales.begin(), allLocales.end());

    next->sortedKeys.reserve(next->table.size());
    for (const auto& [key, entry] : next->table) {
        next->sortedKeys.push_back(key);
    }
    std::sort(next->sortedKeys.begin(), next->sortedKeys.end());

    return next;
}

void TranslationService::publish(std::shared_ptr<TranslationSnapshot> next) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    next->version = m_nextVersion++;
    m_current = std::move(next);
}

void TranslationService::notifyListeners() {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        for (const auto& [id, listener] : m_listeners) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener();
        } catch (const std::exception& e) {
            std::cerr << "[TranslationService] Change listener threw: " << e.what() << std::endl;
        }
    }
}

domain::TranslationTable TranslationService::refresh(const std::string& locale,
                                                     bool baselineEnabled,
                                                     const std::vector<std::string>& candidateRoots,
                                                     const std::vector<std::string>& configuredRoots) {
    std::shared_ptr<const TranslationSnapshot> published;
    {
        std::lock_guard<std::mutex> refreshLock(m_refreshMutex);

        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_locale = locale;
            m_workspaceRoots = candidateRoots;
            m_configuredRoots = configuredRoots;
        }

        auto next = build(locale, baselineEnabled, candidateRoots, configuredRoots);
        std::cout << "[TranslationService] " << next->table.size() << " translations for " << locale
                  << " from " << next->sources.size() << " resource pack(s)" << std::endl;
        published = next;
        publish(std::move(next));
    }

    notifyListeners();
    return published->table;
}

domain::TranslationTable TranslationService::refresh() {
    std::string locale;
    std::vector<std::string> workspaceRoots;
    std::vector<std::string> configuredRoots;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        locale = m_locale;
        workspaceRoots = m_workspaceRoots;
        configuredRoots = m_configuredRoots;
    }
    return refresh(locale, isBaselineEnabled(), workspaceRoots, configuredRoots);
}

void TranslationService::setLocale(const std::string& locale) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_locale = locale;
    }
    refresh();
}

std::shared_ptr<const TranslationSnapshot> TranslationService::snapshot() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_current;
}

std::optional<domain::TranslationEntry> TranslationService::lookup(const std::string& key) const {
    auto current = snapshot();
    auto it = current->table.find(key);
    if (it == current->table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> TranslationService::lookupValue(const std::string& key) const {
    auto entry = lookup(key);
    if (!entry) return std::nullopt;
    return entry->value;
}

bool TranslationService::exists(const std::string& key) const {
    auto current = snapshot();
    return current->table.find(key) != current->table.end();
}

std::vector<domain::TranslationEntry> TranslationService::search(const std::string& query, int limit) const {
    std::vector<domain::TranslationEntry> results;
    if (limit <= 0) {
        return results;
    }

    auto current = snapshot();
    const std::string needle = ToLower(query);

    for (const auto& key : current->sortedKeys) {
        const auto& entry = current->table.at(key);
        if (ToLower(entry.key).find(needle) == std::string::npos &&
            ToLower(entry.value).find(needle) == std::string::npos) {
            continue;
        }
        results.push_back(entry);
        if (static_cast<int>(results.size()) >= limit) break;
    }
    return results;
}

std::string TranslationService::getCurrentLocale() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_locale;
}

std::vector<std::string> TranslationService::getAvailableLocales() const {
    return snapshot()->availableLocales;
}

std::vector<domain::SourceInfo> TranslationService::getSources() const {
    return snapshot()->sources;
}

domain::TranslationTable TranslationService::getAllTranslations() const {
    return snapshot()->table;
}

std::uint64_t TranslationService::version() const {
    return snapshot()->version;
}

void TranslationService::setBaselineEnabled(bool enabled) {
    if (m_baseline) m_baseline->setEnabled(enabled);
}

bool TranslationService::isBaselineEnabled() const {
    return m_baseline && m_baseline->isEnabled();
}

void TranslationService::clearBaselineCache(const std::optional<std::string>& locale) {
    if (!m_baseline) return;
    m_baseline->clearCache(locale);
    refresh();
}

TranslationService::ListenerId TranslationService::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    ListenerId id = m_nextListenerId++;
    m_listeners[id] = std::move(listener);
    return id;
}

void TranslationService::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.erase(id);
}

} // namespace langlens::application
