#pragma once
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "frontier/core/constants.hpp"

namespace Frontier {
namespace Utils {

struct DomainInfo {
    std::string name;         // registrable label, e.g. "example"
    std::string full_domain;  // e.g. "example.co.uk"
};

/**
 * Bounded LRU cache for domain extraction results. Owned by the caller and
 * passed into Url helpers; negative results are cached as well.
 */
class UrlCache {
public:
    explicit UrlCache(size_t capacity = Core::Constants::URL_CACHE_SIZE);

    // Outer optional: cache hit. Inner optional: the cached result.
    std::optional<std::optional<DomainInfo>> lookup(const std::string& url);
    void insert(const std::string& url, const std::optional<DomainInfo>& info);

    void   clear();
    size_t size() const;
    size_t capacity() const {
        return capacity_;
    }

private:
    using Item = std::pair<std::string, std::optional<DomainInfo>>;

    size_t                                                 capacity_;
    mutable std::mutex                                     mutex_;
    std::list<Item>                                        items_;
    std::unordered_map<std::string, std::list<Item>::iterator> index_;
};

}  // namespace Utils
}  // namespace Frontier
