#include "frontier/store/url_store.hpp"

namespace Frontier {
namespace Store {

std::map<std::string, DomainCounts> UrlStore::get_all_counts() const {
    std::map<std::string, DomainCounts> counts;
    for (const auto& record : registry_.records())
        counts.emplace(record->key(), record->state().counts);
    return counts;
}

std::vector<std::string> UrlStore::get_known_domains() const {
    return registry_.all_domains().keys();
}

size_t UrlStore::total_url_count() const {
    size_t total = 0;
    for (const auto& record : registry_.records())
        total += record->state().counts.total;
    return total;
}

bool UrlStore::is_known(const std::string& url) const {
    auto canonical = split_url(url);
    if (!canonical)
        return false;
    auto record = registry_.find(canonical->domain);
    return record && record->is_known(canonical->path);
}

bool UrlStore::has_been_visited(const std::string& url) const {
    auto canonical = split_url(url);
    if (!canonical)
        return false;
    auto record = registry_.find(canonical->domain);
    return record && record->has_been_visited(canonical->path);
}

std::vector<std::string> UrlStore::filter_unknown_urls(const std::vector<std::string>& urls) const {
    std::vector<std::string> unknown;
    for (const auto& url : urls) {
        if (!is_known(url))
            unknown.push_back(url);
    }
    return unknown;
}

std::vector<std::string>
UrlStore::filter_unvisited_urls(const std::vector<std::string>& urls) const {
    std::vector<std::string> unvisited;
    for (const auto& url : urls) {
        auto canonical = split_url(url);
        if (!canonical)
            continue;
        auto record = registry_.find(canonical->domain);
        if (record && record->is_known(canonical->path)
            && !record->has_been_visited(canonical->path))
            unvisited.push_back(url);
    }
    return unvisited;
}

std::vector<std::string> UrlStore::find_known_urls(const std::string& domain) const {
    std::vector<std::string> urls;
    auto                     record = find_domain(domain);
    if (!record)
        return urls;
    for (auto& path : record->find_known())
        urls.push_back(record->key() + path);
    return urls;
}

std::vector<std::string> UrlStore::find_unvisited_urls(const std::string& domain) const {
    std::vector<std::string> urls;
    auto                     record = find_domain(domain);
    if (!record)
        return urls;
    for (auto& path : record->find_unvisited())
        urls.push_back(record->key() + path);
    return urls;
}

std::vector<std::string> UrlStore::get_unvisited_domains() const {
    std::vector<std::string> domains;
    for (const auto& record : registry_.records()) {
        if (!record->is_exhausted())
            domains.push_back(record->key());
    }
    return domains;
}

bool UrlStore::is_exhausted_domain(const std::string& domain) const {
    auto record = find_domain(domain);
    return !record || record->is_exhausted();
}

size_t UrlStore::unvisited_website_count() const {
    return scheduler_.remaining_unvisited_domain_count();
}

}  // namespace Store
}  // namespace Frontier
