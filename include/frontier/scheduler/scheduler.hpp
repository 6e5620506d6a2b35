#pragma once
#include <string>
#include <vector>

#include "frontier/store/domain_registry.hpp"
#include "frontier/store/domain_state.hpp"

namespace Frontier {
namespace Scheduler {

struct DomainWait {
    std::string domain;
    double      wait = 0.0;  // seconds from now
};

struct ScheduledUrl {
    std::string domain;
    std::string path;
    double      wait = 0.0;  // seconds from now

    std::string url() const {
        return domain + path;
    }
};

/**
 * Politeness planning over a DomainRegistry. Reads each domain under its
 * own lock and never holds more than one domain lock at a time.
 */
class Scheduler {
public:
    Scheduler(Store::DomainRegistry& registry, ClockFn clock);

    // Domains with unvisited URLs whose next fetch may happen within
    // `time_limit` seconds, ordered by wait then domain.
    std::vector<DomainWait> downloadable_now(double time_limit) const;

    // Greedy download plan of at most `max_urls` entries. Every planned URL
    // is popped and marked visited at its planned fetch time.
    std::vector<ScheduledUrl> build_schedule(size_t max_urls, double time_limit);

    // True if the domain has waited longer than `threshold_seconds` since it
    // could first have been fetched.
    bool threshold_reached(const std::string& domain, double threshold_seconds) const;

    size_t remaining_unvisited_domain_count() const;

private:
    Store::DomainRegistry& registry_;
    ClockFn                clock_;
};

}  // namespace Scheduler
}  // namespace Frontier
