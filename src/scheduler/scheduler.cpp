#include "frontier/scheduler/scheduler.hpp"
#include <algorithm>
#include <queue>
#include "frontier/core/logger.hpp"

namespace Frontier {
namespace Scheduler {

using Core::Logger;

namespace {

struct Candidate {
    Store::DomainRecordPtr record;
    double                 next_wait = 0.0;
    double                 delay     = 0.0;
    size_t                 scheduled = 0;
};

// Min-heap order: smallest wait, then fewest planned in this pass, then domain.
struct LaterFirst {
    bool operator()(const Candidate& a, const Candidate& b) const {
        if (a.next_wait != b.next_wait)
            return a.next_wait > b.next_wait;
        if (a.scheduled != b.scheduled)
            return a.scheduled > b.scheduled;
        return a.record->key() > b.record->key();
    }
};

}  // namespace

Scheduler::Scheduler(Store::DomainRegistry& registry, ClockFn clock)
    : registry_(registry), clock_(std::move(clock)) {
}

std::vector<DomainWait> Scheduler::downloadable_now(double time_limit) const {
    TimePoint               now = clock_();
    std::vector<DomainWait> eligible;

    for (const auto& record : registry_.records()) {
        Store::DomainState state = record->state();
        if (state.unvisited() == 0)
            continue;
        double wait = state.wait_seconds(now);
        if (wait <= time_limit)
            eligible.push_back({record->key(), wait});
    }

    std::sort(eligible.begin(), eligible.end(), [](const DomainWait& a, const DomainWait& b) {
        if (a.wait != b.wait)
            return a.wait < b.wait;
        return a.domain < b.domain;
    });
    return eligible;
}

std::vector<ScheduledUrl> Scheduler::build_schedule(size_t max_urls, double time_limit) {
    std::vector<ScheduledUrl> plan;
    if (max_urls == 0)
        return plan;

    TimePoint                                                          now = clock_();
    std::priority_queue<Candidate, std::vector<Candidate>, LaterFirst> queue;

    for (auto& record : registry_.records()) {
        Store::DomainState state = record->state();
        if (state.unvisited() == 0)
            continue;
        double wait = state.wait_seconds(now);
        if (wait > time_limit)
            continue;
        queue.push({record, wait, state.crawl_delay, 0});
    }

    while (plan.size() < max_urls && !queue.empty()) {
        Candidate candidate = queue.top();
        queue.pop();
        if (candidate.next_wait > time_limit)
            break;

        // Another planner may have taken slots of this domain since the queue was filled.
        auto popped = candidate.record->pop_planned(now,
                                                    add_seconds(now, candidate.next_wait),
                                                    add_seconds(now, time_limit));
        if (!popped)
            continue;

        double wait = seconds_between(now, popped->slot);
        plan.push_back({candidate.record->key(), std::move(popped->path), wait});
        ++candidate.scheduled;
        candidate.next_wait = wait + candidate.delay;
        queue.push(std::move(candidate));
    }

    Logger::debug("Scheduler: planned " + std::to_string(plan.size()) + " URLs within "
                  + std::to_string(time_limit) + "s");
    return plan;
}

bool Scheduler::threshold_reached(const std::string& domain, double threshold_seconds) const {
    auto record = registry_.find(domain);
    if (!record)
        return false;
    return record->state().incurred_wait(clock_()) > threshold_seconds;
}

size_t Scheduler::remaining_unvisited_domain_count() const {
    size_t count = 0;
    for (const auto& record : registry_.records()) {
        if (!record->is_exhausted())
            ++count;
    }
    return count;
}

}  // namespace Scheduler
}  // namespace Frontier
