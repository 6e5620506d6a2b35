#include "frontier/core/logger.hpp"
#include "frontier/store/url_store.hpp"

namespace Frontier {
namespace Store {

using Core::Logger;

std::optional<std::string> UrlStore::get_url(const std::string& domain, bool as_visited) {
    auto record = find_domain(domain);
    if (!record)
        return std::nullopt;

    auto path = as_visited ? record->pop_next(now()) : record->peek_next();
    if (!path) {
        Logger::debug("No unvisited URL left for " + record->key());
        return std::nullopt;
    }
    return record->key() + *path;
}

bool UrlStore::store_rules(const std::string&    domain,
                           const std::string&    rules,
                           std::optional<double> crawl_delay) {
    auto record = find_domain(domain);
    if (!record) {
        Logger::debug("Ignoring rules for unknown domain " + domain);
        return false;
    }
    record->store_rules(codec_->encode(rules), crawl_delay);
    return true;
}

std::optional<std::string> UrlStore::get_rules(const std::string& domain) const {
    auto record = find_domain(domain);
    if (!record)
        return std::nullopt;
    auto encoded = record->rules();
    if (!encoded)
        return std::nullopt;
    return codec_->decode(*encoded);
}

double UrlStore::get_crawl_delay(const std::string& domain, double default_delay) const {
    auto record = find_domain(domain);
    if (!record)
        return default_delay;
    DomainState state = record->state();
    return state.explicit_delay ? state.crawl_delay : default_delay;
}

std::vector<std::string> UrlStore::get_download_urls(double time_limit, size_t max_urls) {
    std::vector<std::string> urls;
    TimePoint                t = now();

    for (const auto& record : registry_.records()) {
        if (urls.size() >= max_urls)
            break;
        if (auto path = record->pop_if_due(t, time_limit))
            urls.push_back(record->key() + *path);
    }

    Logger::debug("Download URLs: " + std::to_string(urls.size()) + " ready");
    return urls;
}

std::vector<Scheduler::DomainWait> UrlStore::downloadable_domains(double time_limit) const {
    return scheduler_.downloadable_now(time_limit);
}

std::vector<Scheduler::ScheduledUrl> UrlStore::establish_download_schedule(size_t max_urls,
                                                                           double time_limit) {
    return scheduler_.build_schedule(max_urls, time_limit);
}

bool UrlStore::download_threshold_reached(size_t threshold) const {
    for (const auto& record : registry_.records()) {
        if (record->state().downloads >= threshold)
            return true;
    }
    return false;
}

bool UrlStore::threshold_reached(const std::string& domain, double threshold_seconds) const {
    return scheduler_.threshold_reached(domain_key(domain), threshold_seconds);
}

}  // namespace Store
}  // namespace Frontier
