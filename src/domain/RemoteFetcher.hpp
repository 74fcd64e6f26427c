/**
 * @file RemoteFetcher.hpp
 * @brief Interface for retrieving a text resource by URL.
 */

#pragma once
#include <string>
#include <optional>

namespace langlens::domain {

/**
 * @class RemoteFetcher
 * @brief Abstract transport used by the baseline cache.
 */
class RemoteFetcher {
public:
    virtual ~RemoteFetcher() = default;

    /**
     * @brief Fetches the body at url.
     * @return The body on a 2xx response, nullopt on any failure (already logged).
     */
    virtual std::optional<std::string> fetch(const std::string& url) = 0;
};

} // namespace langlens::domain
