#include <unordered_set>
#include "frontier/core/logger.hpp"
#include "frontier/store/url_store.hpp"
#include "frontier/utils/link_extractor.hpp"
#include "frontier/utils/string_utils.hpp"
#include "frontier/utils/url.hpp"

namespace Frontier {
namespace Store {

using Core::Logger;
using Utils::Url;

size_t UrlStore::add_from_html(const std::string& html,
                               const std::string& base_url,
                               bool               external,
                               bool               with_nav) {
    std::vector<std::string>        regular;
    std::vector<std::string>        navigation;
    std::unordered_set<std::string> seen;

    for (const auto& href : Utils::Text::LinkExtractor::extract_links(html)) {
        std::string link = Url::resolve(base_url, Utils::Text::trim(href));
        if (link.empty() || Url::is_known_link(link, seen))
            continue;
        seen.insert(link);

        if (!external && Url::is_external(link, base_url, true, &cache_))
            continue;
        if (Utils::is_not_crawlable(link))
            continue;

        if (with_nav && Utils::is_navigation_page(link))
            navigation.push_back(link);
        else
            regular.push_back(link);
    }

    size_t added = add_urls(regular);
    // Navigation pages lead to more content and go to the front of the queue.
    added += add_urls(navigation, true);

    Logger::debug("Links from " + base_url + ": " + std::to_string(seen.size()) + " found, "
                  + std::to_string(added) + " new");
    return added;
}

}  // namespace Store
}  // namespace Frontier
