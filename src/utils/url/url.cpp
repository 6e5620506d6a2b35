#include "frontier/utils/url.hpp"
#include <algorithm>
#include <regex>
#include <sstream>
#include <string_view>
#include "frontier/utils/string_utils.hpp"

namespace Frontier {
namespace Utils {

namespace {

const std::regex IPV4_REGEX(R"(^[0-9]{1,3}\.[0-9]{1,3}\.[0-9]{1,3}\.[0-9]{1,3}$)");
const std::regex WWW_PREFIX_REGEX(R"(^www[0-9]*\.)");
const std::regex FEED_WHITELIST_REGEX("(feedburner|feedproxy)", std::regex::icase);

// Second-level labels under which country suffixes register names,
// e.g. "co.uk" or "com.au".
const std::set<std::string> SECOND_LEVEL_LABELS = {
    "ac", "co", "com", "edu", "gov", "net", "org"};

bool has_domain_scheme(const std::string& scheme) {
    std::string s = Text::to_lower(scheme);
    return s == "http" || s == "https" || s == "ftp" || s == "ftps";
}

std::optional<DomainInfo> compute_domain_info(const std::string& url) {
    UrlParsed parsed = Url::parse(url);
    if (!has_domain_scheme(parsed.scheme))
        return std::nullopt;

    std::string host = Text::to_lower(parsed.host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    if (host.empty())
        return std::nullopt;

    if (host.front() == '[' || std::regex_match(host, IPV4_REGEX))
        return DomainInfo{host, host};

    host = std::regex_replace(host, WWW_PREFIX_REGEX, "");

    std::vector<std::string> labels = Text::split(host, '.');
    if (labels.size() < 2
        || std::any_of(labels.begin(), labels.end(), [](const std::string& l) { return l.empty(); }))
        return std::nullopt;

    size_t keep = 2;
    if (labels.size() >= 3 && labels.back().size() == 2
        && SECOND_LEVEL_LABELS.count(labels[labels.size() - 2]))
        keep = 3;

    std::string full;
    for (size_t i = labels.size() - keep; i < labels.size(); ++i) {
        if (!full.empty())
            full += '.';
        full += labels[i];
    }
    return DomainInfo{labels[labels.size() - keep], full};
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos && colon > 0);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv.remove_prefix(end_auth == std::string_view::npos ? sv.size() : end_auth);

        size_t at = authority.find_last_of('@');
        if (at != std::string::npos) {
            parsed.userinfo = authority.substr(0, at);
            authority       = authority.substr(at + 1);
        }

        if (!authority.empty() && authority[0] == '[') {
            size_t end_bracket = authority.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = authority.substr(0, end_bracket + 1);
                size_t p_colon = authority.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = authority.substr(p_colon + 1);
            }
            else {
                parsed.host = authority;
            }
        }
        else {
            size_t p_colon = authority.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = authority.substr(0, p_colon);
                parsed.port = authority.substr(p_colon + 1);
            }
            else {
                parsed.host = authority;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment     = std::string(sv.substr(h_pos + 1));
        parsed.has_fragment = true;
        sv                  = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query     = std::string(sv.substr(q_pos + 1));
        parsed.has_query = true;
        sv               = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    // mailto:, javascript:, tel: and friends
    size_t colon_pos = relative.find(':');
    if (colon_pos != std::string::npos && colon_pos < 10
        && relative.find('/') > colon_pos)
        return "";

    UrlParsed base_parsed = parse(base);

    if (relative.substr(0, 2) == "//")
        return base_parsed.scheme + ":" + relative;

    std::string auth = base_parsed.host;
    if (!base_parsed.port.empty())
        auth += ":" + base_parsed.port;

    std::string path = relative;
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    if (path.empty() || path[0] != '/') {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir = last_slash == std::string::npos ? "/" : dir.substr(0, last_slash + 1);
        path = dir + path;
    }

    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized.back() != '/')
        normalized += "/";

    return base_parsed.scheme + "://" + auth + normalized + query_frag;
}

std::string Url::get_base_url(const std::string& url) {
    UrlParsed   parsed = parse(url);
    std::string netloc = parsed.host;
    if (!parsed.userinfo.empty())
        netloc = parsed.userinfo + "@" + netloc;
    if (!parsed.port.empty())
        netloc += ":" + parsed.port;
    if (parsed.scheme.empty())
        return netloc;
    return parsed.scheme + "://" + netloc;
}

std::optional<std::pair<std::string, std::string>>
Url::get_host_and_path(const std::string& url) {
    UrlParsed parsed = parse(url);
    if (parsed.scheme.empty() || parsed.host.empty())
        return std::nullopt;

    std::string path = parsed.path;
    if (parsed.has_query)
        path += "?" + parsed.query;
    if (parsed.has_fragment)
        path += "#" + parsed.fragment;

    return std::make_pair(get_base_url(url), path);
}

std::optional<DomainInfo> Url::get_domain_info(const std::string& url, UrlCache* cache) {
    if (url.empty())
        return std::nullopt;

    if (cache) {
        if (auto hit = cache->lookup(url))
            return *hit;
    }

    auto info = compute_domain_info(url);
    if (cache)
        cache->insert(url, info);
    return info;
}

std::optional<std::string> Url::extract_domain(const std::string&           url,
                                               const std::set<std::string>& blacklist,
                                               UrlCache*                    cache) {
    auto info = get_domain_info(url, cache);
    if (!info)
        return std::nullopt;
    if (blacklist.count(info->name) || blacklist.count(info->full_domain))
        return std::nullopt;
    return info->full_domain;
}

std::string Url::fix_relative_urls(const std::string& base_url, const std::string& url) {
    if (Text::starts_with(url, "//"))
        return (Text::starts_with(base_url, "https") ? "https:" : "http:") + url;
    if (Text::starts_with(url, "/"))
        return base_url + url;
    if (Text::starts_with(url, ".")) {
        size_t last_slash = url.find_last_of('/');
        if (last_slash == std::string::npos)
            return base_url + "/" + url;
        return base_url + "/" + url.substr(last_slash + 1);
    }
    if (!Text::starts_with(url, "http") && !Text::starts_with(url, "{"))
        return base_url + "/" + url;
    return url;
}

std::vector<std::string> Url::filter_urls(const std::vector<std::string>& links,
                                          const std::optional<std::string>& url_filter) {
    std::set<std::string> selected;
    if (!url_filter) {
        selected.insert(links.begin(), links.end());
        return std::vector<std::string>(selected.begin(), selected.end());
    }

    for (const auto& link : links) {
        if (link.find(*url_filter) != std::string::npos)
            selected.insert(link);
    }
    // feed aggregators carry the original host only in a parameter
    if (selected.empty()) {
        for (const auto& link : links) {
            if (std::regex_search(link, FEED_WHITELIST_REGEX))
                selected.insert(link);
        }
    }
    return std::vector<std::string>(selected.begin(), selected.end());
}

bool Url::is_external(const std::string& url,
                      const std::string& reference,
                      bool               ignore_suffix,
                      UrlCache*          cache) {
    auto ref    = get_domain_info(reference, cache);
    auto target = get_domain_info(url, cache);

    std::optional<std::string> ref_key;
    std::optional<std::string> target_key;
    if (ref)
        ref_key = ignore_suffix ? ref->name : ref->full_domain;
    if (target)
        target_key = ignore_suffix ? target->name : target->full_domain;
    return ref_key != target_key;
}

bool Url::is_known_link(const std::string&                     link,
                        const std::unordered_set<std::string>& known_links) {
    if (known_links.count(link))
        return true;

    auto variants_known = [&known_links](const std::string& candidate) {
        std::string stripped = Text::rstrip(candidate, '/');
        return known_links.count(candidate) || known_links.count(stripped)
               || known_links.count(stripped + "/");
    };

    if (variants_known(link))
        return true;

    if (Text::starts_with(link, "http")) {
        std::string swapped = Text::starts_with(link, "https")
                                  ? link.substr(0, 4) + link.substr(5)
                                  : link.substr(0, 4) + "s" + link.substr(4);
        if (variants_known(swapped))
            return true;
    }
    return false;
}

}  // namespace Utils
}  // namespace Frontier
