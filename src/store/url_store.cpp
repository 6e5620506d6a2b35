#include "frontier/store/url_store.hpp"
#include <algorithm>
#include "frontier/core/errors.hpp"
#include "frontier/core/logger.hpp"
#include "frontier/utils/string_utils.hpp"

namespace Frontier {
namespace Store {

using Core::Logger;

UrlStore::UrlStore(StoreOptions options)
    : options_(std::move(options)),
      clock_(options_.clock ? options_.clock : ClockFn([] { return Clock::now(); })),
      codec_(make_codec(options_.compressed)),
      registry_(options_.default_crawl_delay, *codec_),
      scheduler_(registry_, clock_) {
}

TimePoint UrlStore::now() const {
    return clock_();
}

std::string UrlStore::domain_key(const std::string& domain) {
    std::string key = Utils::Text::rstrip(Utils::Text::trim(domain), '/');
    validate_domain_key(key);
    return key;
}

DomainRecordPtr UrlStore::find_domain(const std::string& domain) const {
    return registry_.find(domain_key(domain));
}

std::optional<Utils::CanonicalUrl> UrlStore::split_url(const std::string& url) const {
    Utils::CanonicalizeOptions canon;
    canon.strict   = options_.strict;
    canon.language = options_.language;
    return Utils::canonicalize(url, canon);
}

size_t UrlStore::add_urls(const std::vector<std::string>& urls, bool prepend, bool visited) {
    std::vector<Utils::CanonicalUrl> accepted;
    accepted.reserve(urls.size());

    for (const auto& url : urls) {
        auto canonical = split_url(url);
        if (!canonical) {
            Logger::warn("Discarding invalid URL: " + url);
            continue;
        }
        if (options_.strict && Utils::is_not_crawlable(canonical->url)) {
            Logger::debug("Discarding non-crawlable URL: " + canonical->url);
            continue;
        }
        accepted.push_back(std::move(*canonical));
    }

    // Prepending one at a time in reverse keeps the batch in input order.
    if (prepend)
        std::reverse(accepted.begin(), accepted.end());

    TimePoint t     = now();
    size_t    added = 0;
    for (const auto& canonical : accepted) {
        auto record = registry_.ensure_domain(canonical.domain);
        if (record->add_url(canonical.path, visited, prepend, t) == AddResult::Inserted)
            ++added;
    }
    return added;
}

bool UrlStore::mark_visited(const std::string& url) {
    auto canonical = split_url(url);
    if (!canonical)
        return false;

    auto record = registry_.find(canonical->domain);
    if (!record || !record->mark_visited(canonical->path, now())) {
        Logger::debug("Cannot mark unknown URL as visited: " + url);
        return false;
    }
    return true;
}

void UrlStore::reset() {
    registry_.clear();
    cache_.clear();
    Logger::debug("UrlStore: reset");
}

}  // namespace Store
}  // namespace Frontier
