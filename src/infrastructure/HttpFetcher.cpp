#include "infrastructure/HttpFetcher.hpp"
#include <httplib.h>
#include <iostream>
#include <regex>

namespace langlens::infrastructure {

namespace {
bool IsRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}

bool HasScheme(const std::string& reference) {
    static const std::regex re(R"(^[A-Za-z][A-Za-z0-9+.-]*:)");
    return std::regex_search(reference, re);
}
}

HttpFetcher::HttpFetcher(int timeoutSeconds, int maxRedirects)
    : m_timeoutSeconds(timeoutSeconds), m_maxRedirects(maxRedirects) {}

std::optional<std::pair<std::string, std::string>> HttpFetcher::SplitUrl(const std::string& url) {
    static const std::regex re(R"(^(https?://[^/?#]+)(.*)$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        return std::nullopt;
    }
    std::string path = m[2].str();
    if (path.empty()) path = "/";
    return std::make_pair(m[1].str(), path);
}

std::string HttpFetcher::ResolveLocation(const std::string& currentUrl, const std::string& location) {
    // Absolute references pass through; unsupported schemes are rejected on the next hop.
    if (HasScheme(location)) {
        return location;
    }

    auto current = SplitUrl(currentUrl);
    if (!current) {
        return location;
    }
    const std::string& origin = current->first;

    if (location.rfind("//", 0) == 0) {
        return origin.substr(0, origin.find("//")) + location;
    }
    if (!location.empty() && location[0] == '/') {
        return origin + location;
    }

    // Relative to the directory of the current path.
    std::string base = current->second;
    size_t query = base.find_first_of("?#");
    if (query != std::string::npos) base.erase(query);
    size_t slash = base.find_last_of('/');
    base = (slash == std::string::npos) ? "/" : base.substr(0, slash + 1);
    return origin + base + location;
}

std::optional<std::string> HttpFetcher::fetch(const std::string& url) {
    std::string currentUrl = url;

    for (int hop = 0; hop <= m_maxRedirects; ++hop) {
        auto parts = SplitUrl(currentUrl);
        if (!parts) {
            std::cerr << "[HttpFetcher] Unsupported URL: " << currentUrl << std::endl;
            return std::nullopt;
        }

        httplib::Client cli(parts->first);
        if (!cli.is_valid()) {
            std::cerr << "[HttpFetcher] Cannot create client for " << parts->first
                      << " (is HTTPS support compiled in?)" << std::endl;
            return std::nullopt;
        }
        cli.set_connection_timeout(m_timeoutSeconds, 0);
        cli.set_read_timeout(m_timeoutSeconds, 0);
        cli.set_write_timeout(m_timeoutSeconds, 0);
        cli.set_follow_location(false);

        auto res = cli.Get(parts->second);
        if (!res) {
            std::cerr << "[HttpFetcher] Connection failed for " << currentUrl << ": "
                      << httplib::to_string(res.error()) << std::endl;
            return std::nullopt;
        }

        if (IsRedirect(res->status)) {
            if (!res->has_header("Location")) {
                std::cerr << "[HttpFetcher] Redirect without location header from " << currentUrl << std::endl;
                return std::nullopt;
            }
            currentUrl = ResolveLocation(currentUrl, res->get_header_value("Location"));
            continue;
        }

        if (!IsSuccess(res->status)) {
            std::cerr << "[HttpFetcher] HTTP Error " << res->status << ": Failed to fetch " << currentUrl << std::endl;
            return std::nullopt;
        }

        return res->body;
    }

    std::cerr << "[HttpFetcher] Too many redirects fetching " << url << std::endl;
    return std::nullopt;
}

} // namespace langlens::infrastructure
