#include "frontier/store/domain_state.hpp"
#include <algorithm>

namespace Frontier {
namespace Store {

const char* to_string(DomainStatus status) {
    switch (status) {
        case DomainStatus::Unseen:
            return "unseen";
        case DomainStatus::HasUnvisited:
            return "has_unvisited";
        case DomainStatus::Exhausted:
            return "exhausted";
    }
    return "unknown";
}

double DomainState::incurred_wait(TimePoint now) const {
    if (status != DomainStatus::HasUnvisited || !pending_since)
        return 0.0;

    TimePoint since = *pending_since;
    if (last_access)
        since = std::max(since, add_seconds(*last_access, crawl_delay));

    double waited = seconds_between(since, now);
    return waited > 0.0 ? waited : 0.0;
}

}  // namespace Store
}  // namespace Frontier
