/**
 * @file HttpFetcher.hpp
 * @brief HTTP(S) client for fetching remote translation files.
 */

#pragma once

#include <string>
#include <optional>
#include <utility>
#include "domain/RemoteFetcher.hpp"

namespace langlens::infrastructure {

/**
 * @class HttpFetcher
 * @brief Plain GET with an explicit timeout and bounded manual redirect handling.
 *
 * A redirect without a Location header, a redirect chain longer than
 * maxRedirects, a transport error or a non-2xx status all count as failures.
 */
class HttpFetcher : public domain::RemoteFetcher {
public:
    explicit HttpFetcher(int timeoutSeconds = 10, int maxRedirects = 5);

    std::optional<std::string> fetch(const std::string& url) override;

    /**
     * @brief Splits "scheme://host[:port]/path" into origin and path.
     * @return nullopt for anything that is not an http or https URL.
     */
    static std::optional<std::pair<std::string, std::string>> SplitUrl(const std::string& url);

    /** @brief Resolves a Location header value against the URL that produced it. */
    static std::string ResolveLocation(const std::string& currentUrl, const std::string& location);

private:
    int m_timeoutSeconds;
    int m_maxRedirects;
};

} // namespace langlens::infrastructure
