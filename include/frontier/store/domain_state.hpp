#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace Frontier {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

inline double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

inline TimePoint add_seconds(TimePoint tp, double seconds) {
    return tp + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

namespace Store {

enum class DomainStatus { Unseen, HasUnvisited, Exhausted };

const char* to_string(DomainStatus status);

struct DomainCounts {
    size_t total   = 0;
    size_t visited = 0;

    bool operator==(const DomainCounts& other) const {
        return total == other.total && visited == other.visited;
    }
};

struct DomainState {
    DomainStatus status = DomainStatus::Unseen;

    double crawl_delay    = 0.0;
    bool   explicit_delay = false;  // set from rules rather than the store default

    std::string rules;  // encoded through the store codec
    bool        has_rules = false;

    std::optional<TimePoint> last_access;
    std::optional<TimePoint> pending_since;

    DomainCounts counts;
    size_t       downloads = 0;

    size_t unvisited() const {
        return counts.total - counts.visited;
    }

    // Earliest point at which the next fetch respects the crawl delay.
    TimePoint next_eligible(TimePoint now) const {
        if (!last_access)
            return now;
        return add_seconds(*last_access, crawl_delay);
    }

    // Seconds to wait from now, never negative.
    double wait_seconds(TimePoint now) const {
        double wait = seconds_between(now, next_eligible(now));
        return wait > 0.0 ? wait : 0.0;
    }

    // Time spent eligible but not fetched.
    double incurred_wait(TimePoint now) const;
};

}  // namespace Store
}  // namespace Frontier
