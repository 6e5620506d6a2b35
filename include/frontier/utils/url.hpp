#pragma once
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "frontier/utils/url_cache.hpp"

namespace Frontier {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool        has_query    = false;
    bool        has_fragment = false;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // scheme://host[:port], or the bare host when the URL has no scheme.
    static std::string get_base_url(const std::string& url);

    // Splits an absolute URL into (base URL, path+query+fragment).
    static std::optional<std::pair<std::string, std::string>>
    get_host_and_path(const std::string& url);

    static std::optional<DomainInfo> get_domain_info(const std::string& url,
                                                     UrlCache*          cache = nullptr);
    static std::optional<std::string>
    extract_domain(const std::string&           url,
                   const std::set<std::string>& blacklist = {},
                   UrlCache*                    cache     = nullptr);

    static std::string fix_relative_urls(const std::string& base_url, const std::string& url);

    static std::vector<std::string> filter_urls(const std::vector<std::string>& links,
                                                const std::optional<std::string>& url_filter);

    static bool is_external(const std::string& url,
                            const std::string& reference,
                            bool               ignore_suffix = true,
                            UrlCache*          cache         = nullptr);

    static bool is_known_link(const std::string&                     link,
                              const std::unordered_set<std::string>& known_links);
};

}  // namespace Utils
}  // namespace Frontier
