#include "frontier/utils/url_filters.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>
#include <vector>
#include "frontier/core/constants.hpp"
#include "frontier/utils/string_utils.hpp"
#include "frontier/utils/url.hpp"

namespace Frontier {
namespace Utils {

namespace {

const std::regex NAVIGATION_REGEX(
    R"([/_-](archives|auteur|author|autor|cat|category|categorie|categories|kategorie|kategorien|page|seite|tag|tags|topic|topics|thema)([/_-]|$))"
    R"(|[?&]page=[0-9]+|/page/[0-9]+)",
    std::regex::icase);

const std::regex NOT_CRAWLABLE_REGEX(
    R"(([/?&.]|^)(login|log-in|logout|register|registrieren|anmelden|signup|sign-up|signin|sign-in|cart|warenkorb|checkout|account|mein-konto|my-account|profile)([/?&.#_-]|$))"
    R"(|[?&](share|reply|replytocom)=|/wp-admin/|/(feed|rss)/?$|\.(rss|atom)$)",
    std::regex::icase);

const std::regex PATH_LANG_REGEX(R"(^/([a-z]{2})(?:[_-][a-z]{2})?(?:/|$))", std::regex::icase);
const std::regex HOST_LANG_REGEX(R"(^([a-z]{2})\.)", std::regex::icase);

bool is_default_port(const std::string& scheme, const std::string& port) {
    return (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
}

bool language_equals(const std::string& candidate, const std::string& language) {
    std::string c = Text::to_lower(candidate);
    if (c == Text::to_lower(language))
        return true;
    return Core::get_language_aliases(Text::to_lower(language)).count(c) > 0;
}

std::vector<std::pair<std::string, std::string>> split_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    for (const auto& part : Text::split(query, '&')) {
        if (part.empty())
            continue;
        size_t eq = part.find('=');
        if (eq == std::string::npos)
            params.emplace_back(part, "");
        else
            params.emplace_back(part.substr(0, eq), part.substr(eq + 1));
    }
    return params;
}

std::string clean_query(const std::string& query, bool strict) {
    auto params = split_query(query);
    std::stable_sort(params.begin(), params.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    std::string out;
    for (const auto& [key, value] : params) {
        if (strict) {
            std::string k = Text::to_lower(key);
            if (!Core::get_allowed_params().count(k) && !Core::get_control_params().count(k))
                continue;
        }
        if (!out.empty())
            out += '&';
        out += key;
        if (!value.empty())
            out += "=" + value;
    }
    return out;
}

}  // namespace

std::optional<CanonicalUrl> canonicalize(const std::string&         raw_url,
                                         const CanonicalizeOptions& options) {
    std::string url = Text::trim(raw_url);
    if (url.empty() || url.size() > Core::Constants::MAX_URL_LENGTH)
        return std::nullopt;
    if (url.find_first_of(" \t\r\n") != std::string::npos)
        return std::nullopt;

    UrlParsed   parsed = Url::parse(url);
    std::string scheme = Text::to_lower(parsed.scheme);
    if (scheme != "http" && scheme != "https")
        return std::nullopt;

    std::string host = Text::to_lower(parsed.host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    if (host.empty())
        return std::nullopt;
    if (host.front() != '[' && host != "localhost" && host.find('.') == std::string::npos)
        return std::nullopt;

    if (!parsed.port.empty()
        && !std::all_of(parsed.port.begin(), parsed.port.end(), [](unsigned char c) {
               return std::isdigit(c);
           }))
        return std::nullopt;

    CanonicalUrl canonical;
    canonical.domain = scheme + "://" + host;
    if (!parsed.port.empty() && !is_default_port(scheme, parsed.port))
        canonical.domain += ":" + parsed.port;

    canonical.path = parsed.path;
    if (parsed.has_query) {
        std::string query = clean_query(parsed.query, options.strict);
        if (!query.empty())
            canonical.path += "?" + query;
    }
    if (parsed.has_fragment && !options.strict && !parsed.fragment.empty())
        canonical.path += "#" + parsed.fragment;

    canonical.url = canonical.domain + canonical.path;

    if (!matches_language(canonical.url, options.language, options.strict))
        return std::nullopt;

    return canonical;
}

bool is_navigation_page(const std::string& url) {
    return std::regex_search(url, NAVIGATION_REGEX);
}

bool is_not_crawlable(const std::string& url) {
    return std::regex_search(url, NOT_CRAWLABLE_REGEX);
}

bool matches_language(const std::string&                url,
                      const std::optional<std::string>& language,
                      bool                              strict) {
    if (!language || language->empty())
        return true;

    UrlParsed   parsed = Url::parse(url);
    std::smatch match;

    if (std::regex_search(parsed.path, match, PATH_LANG_REGEX))
        return language_equals(match[1].str(), *language);

    for (const auto& [key, value] : split_query(parsed.query)) {
        if (Core::get_control_params().count(Text::to_lower(key)) && !value.empty())
            return language_equals(value.substr(0, 2), *language)
                   || language_equals(value, *language);
    }

    if (strict) {
        std::string host = Text::to_lower(parsed.host);
        if (std::regex_search(host, match, HOST_LANG_REGEX))
            return language_equals(match[1].str(), *language);
    }
    return true;
}

}  // namespace Utils
}  // namespace Frontier
