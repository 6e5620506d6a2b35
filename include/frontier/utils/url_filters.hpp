#pragma once
#include <optional>
#include <string>

namespace Frontier {
namespace Utils {

struct CanonicalizeOptions {
    bool                       strict = false;
    std::optional<std::string> language;
};

struct CanonicalUrl {
    std::string url;     // domain + path
    std::string domain;  // scheme://host[:port]
    std::string path;    // path[?query][#fragment]
};

/**
 * Normalizes an absolute http(s) URL: lowercases scheme and host, drops
 * default ports, sorts query parameters. Strict mode also drops the
 * fragment and every parameter not known to identify content. Returns
 * std::nullopt for URLs that cannot enter the frontier.
 */
std::optional<CanonicalUrl> canonicalize(const std::string&         raw_url,
                                         const CanonicalizeOptions& options = {});

// Archive, category, tag and pagination pages.
bool is_navigation_page(const std::string& url);

// Login, cart, account and feed endpoints.
bool is_not_crawlable(const std::string& url);

// False when the URL carries a language marker for another language.
bool matches_language(const std::string&                url,
                      const std::optional<std::string>& language,
                      bool                              strict = false);

}  // namespace Utils
}  // namespace Frontier
