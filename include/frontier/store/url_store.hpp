#pragma once
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "frontier/core/constants.hpp"
#include "frontier/scheduler/scheduler.hpp"
#include "frontier/store/domain_registry.hpp"
#include "frontier/store/domain_state.hpp"
#include "frontier/store/url_codec.hpp"
#include "frontier/utils/url_cache.hpp"
#include "frontier/utils/url_filters.hpp"

namespace Frontier {
namespace Store {

struct StoreOptions {
    bool                       compressed = false;
    std::optional<std::string> language;
    bool                       strict              = false;
    bool                       verbose             = false;
    double                     default_crawl_delay = Core::Constants::DEFAULT_CRAWL_DELAY;
    ClockFn                    clock;  // Clock::now when empty
};

// Decoded copy of one domain, taken under that domain's lock.
struct DomainDump {
    std::string                domain;
    double                     crawl_delay    = 0.0;
    bool                       explicit_delay = false;
    std::optional<std::string> rules;
    std::optional<TimePoint>   last_access;
    size_t                     downloads = 0;
    std::vector<LedgerRecord>  entries;
};

/**
 * Thread-safe crawl frontier: known and visited URLs grouped by domain,
 * with per-domain politeness bookkeeping and download planning.
 *
 * URLs passed in are canonicalized first; rejected ones are logged and
 * skipped. Domain arguments are scheme://host[:port] keys. Lookups of
 * unknown URLs or domains return empty results, never throw. An empty
 * domain key throws Frontier::InvalidInput.
 */
class UrlStore {
public:
    explicit UrlStore(StoreOptions options = {});

    UrlStore(const UrlStore&)            = delete;
    UrlStore& operator=(const UrlStore&) = delete;

    // Returns the number of new entries.
    size_t add_urls(const std::vector<std::string>& urls, bool prepend = false, bool visited = false);
    size_t add_from_html(const std::string& html,
                         const std::string& base_url,
                         bool               external = false,
                         bool               with_nav = true);
    bool   mark_visited(const std::string& url);

    std::vector<std::string> dump_urls() const;
    std::vector<DomainDump>  snapshot() const;
    void                     print_urls(std::ostream& out) const;
    void                     print_unvisited_urls(std::ostream& out) const;
    void                     write_json_lines(std::ostream& out) const;

    std::map<std::string, DomainCounts> get_all_counts() const;
    std::vector<std::string>            get_known_domains() const;
    size_t                              total_url_count() const;

    bool                     is_known(const std::string& url) const;
    bool                     has_been_visited(const std::string& url) const;
    std::vector<std::string> filter_unknown_urls(const std::vector<std::string>& urls) const;
    std::vector<std::string> filter_unvisited_urls(const std::vector<std::string>& urls) const;
    std::vector<std::string> find_known_urls(const std::string& domain) const;
    std::vector<std::string> find_unvisited_urls(const std::string& domain) const;
    std::vector<std::string> get_unvisited_domains() const;
    bool                     is_exhausted_domain(const std::string& domain) const;
    size_t                   unvisited_website_count() const;

    void reset();

    std::optional<std::string> get_url(const std::string& domain, bool as_visited = true);

    bool store_rules(const std::string&    domain,
                     const std::string&    rules,
                     std::optional<double> crawl_delay = std::nullopt);
    std::optional<std::string> get_rules(const std::string& domain) const;
    double                     get_crawl_delay(const std::string& domain,
                                               double default_delay = Core::Constants::DEFAULT_CRAWL_DELAY) const;

    std::vector<std::string> get_download_urls(double time_limit = Core::Constants::DEFAULT_TIME_LIMIT,
                                               size_t max_urls   = Core::Constants::DEFAULT_DOWNLOAD_URLS);
    std::vector<Scheduler::DomainWait> downloadable_domains(double time_limit) const;
    std::vector<Scheduler::ScheduledUrl>
         establish_download_schedule(size_t max_urls   = Core::Constants::DEFAULT_SCHEDULE_SIZE,
                                     double time_limit = Core::Constants::DEFAULT_TIME_LIMIT);
    bool download_threshold_reached(size_t threshold) const;
    bool threshold_reached(const std::string& domain, double threshold_seconds) const;

    void save(const std::string& path) const;
    void load(const std::string& path);

    const StoreOptions& options() const {
        return options_;
    }
    Utils::UrlCache& url_cache() {
        return cache_;
    }

private:
    StoreOptions                options_;
    ClockFn                     clock_;
    std::unique_ptr<UrlCodec>   codec_;
    DomainRegistry              registry_;
    Scheduler::Scheduler        scheduler_;
    Utils::UrlCache             cache_;

    TimePoint                          now() const;
    std::optional<Utils::CanonicalUrl> split_url(const std::string& url) const;
    DomainRecordPtr                    find_domain(const std::string& domain) const;

    static std::string domain_key(const std::string& domain);
};

}  // namespace Store
}  // namespace Frontier
