/**
 * @file BaselineProvider.hpp
 * @brief Interface for the default translation dataset that packs override.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "TranslationEntry.hpp"

namespace langlens::domain {

/**
 * @class BaselineProvider
 * @brief Abstract source of the baseline table for a locale.
 *
 * Implementations must not throw from loadTranslations: any failure
 * degrades to the best table they can still produce, possibly empty.
 */
class BaselineProvider {
public:
    virtual ~BaselineProvider() = default;

    /** @brief Loads the baseline table for a locale. */
    virtual TranslationTable loadTranslations(const std::string& locale) = 0;

    /** @brief Locale codes the baseline is known to provide. */
    virtual std::vector<std::string> getAvailableLanguages() const = 0;

    /**
     * @brief Drops persisted baseline data.
     * @param locale Single locale to drop, or nullopt for all of them.
     */
    virtual void clearCache(const std::optional<std::string>& locale) = 0;

    virtual bool isEnabled() const = 0;
    virtual void setEnabled(bool enabled) = 0;
};

} // namespace langlens::domain
