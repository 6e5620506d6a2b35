#include "frontier/utils/url_cache.hpp"

namespace Frontier {
namespace Utils {

UrlCache::UrlCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

std::optional<std::optional<DomainInfo>> UrlCache::lookup(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = index_.find(url);
    if (it == index_.end())
        return std::nullopt;
    items_.splice(items_.begin(), items_, it->second);
    return it->second->second;
}

void UrlCache::insert(const std::string& url, const std::optional<DomainInfo>& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = index_.find(url);
    if (it != index_.end()) {
        it->second->second = info;
        items_.splice(items_.begin(), items_, it->second);
        return;
    }

    items_.emplace_front(url, info);
    index_[url] = items_.begin();

    if (items_.size() > capacity_) {
        index_.erase(items_.back().first);
        items_.pop_back();
    }
}

void UrlCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    items_.clear();
}

size_t UrlCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}  // namespace Utils
}  // namespace Frontier
