#include "frontier/store/domain_registry.hpp"
#include <algorithm>
#include "frontier/core/errors.hpp"

namespace Frontier {
namespace Store {

void validate_domain_key(const std::string& domain) {
    if (domain.empty())
        throw InvalidInput("domain key must not be empty");
}

DomainRecord::DomainRecord(std::string key, double default_delay, const UrlCodec& codec)
    : key_(std::move(key)), ledger_(codec) {
    state_.crawl_delay = default_delay;
}

void DomainRecord::update_status(TimePoint now) {
    state_.counts.total   = ledger_.size();
    state_.counts.visited = ledger_.size() - ledger_.unvisited_count();

    if (ledger_.exhausted()) {
        if (state_.status == DomainStatus::HasUnvisited)
            state_.status = DomainStatus::Exhausted;
        else if (state_.status == DomainStatus::Unseen && ledger_.size() > 0)
            state_.status = DomainStatus::Exhausted;
        state_.pending_since.reset();
        return;
    }

    if (state_.status != DomainStatus::HasUnvisited) {
        state_.status        = DomainStatus::HasUnvisited;
        state_.pending_since = now;
    }
}

AddResult DomainRecord::add_url(std::string_view path, bool visited, bool prepend, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    AddResult                   result = ledger_.add(path, visited, prepend, now);
    if (result != AddResult::Unchanged)
        update_status(now);
    return result;
}

bool DomainRecord::mark_visited(std::string_view path, TimePoint when) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.mark_visited(path, when))
        return false;
    update_status(when);
    return true;
}

bool DomainRecord::is_known(std::string_view path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.contains(path);
}

bool DomainRecord::has_been_visited(std::string_view path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.is_visited(path);
}

std::vector<std::string> DomainRecord::find_known() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.known();
}

std::vector<std::string> DomainRecord::find_unvisited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.unvisited();
}

std::optional<std::string> DomainRecord::peek_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.front_unvisited();
}

std::optional<std::string> DomainRecord::pop_locked(TimePoint now, TimePoint fetch_at) {
    auto path = ledger_.pop_unvisited(fetch_at);
    if (!path)
        return std::nullopt;

    // Planned fetches may lie in the future; last_access never moves back.
    state_.last_access = state_.last_access ? std::max(*state_.last_access, fetch_at) : fetch_at;
    ++state_.downloads;
    update_status(now);
    return path;
}

std::optional<std::string> DomainRecord::pop_next(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_locked(now, now);
}

std::optional<std::string> DomainRecord::pop_if_due(TimePoint now, double min_gap) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.last_access && seconds_between(*state_.last_access, now) < min_gap)
        return std::nullopt;
    return pop_locked(now, now);
}

std::optional<PlannedPop> DomainRecord::pop_planned(TimePoint now,
                                                    TimePoint not_before,
                                                    TimePoint latest) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint                   slot = std::max(not_before, state_.next_eligible(now));
    if (slot > latest)
        return std::nullopt;

    auto path = pop_locked(now, slot);
    if (!path)
        return std::nullopt;
    return PlannedPop{std::move(*path), slot};
}

bool DomainRecord::is_exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.exhausted();
}

DomainState DomainRecord::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void DomainRecord::store_rules(const std::string& encoded, std::optional<double> delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.rules     = encoded;
    state_.has_rules = true;
    if (delay) {
        state_.crawl_delay    = *delay;
        state_.explicit_delay = true;
    }
}

std::optional<std::string> DomainRecord::rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.has_rules)
        return std::nullopt;
    return state_.rules;
}

std::vector<LedgerRecord> DomainRecord::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.records();
}

RecordView DomainRecord::view() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {state_, ledger_.records()};
}

void DomainRecord::restore_access(std::optional<TimePoint> last_access, size_t downloads) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_access = last_access;
    state_.downloads   = downloads;
}

DomainRegistry::DomainRegistry(double default_delay, const UrlCodec& codec)
    : default_delay_(default_delay), codec_(codec) {
}

DomainRecordPtr DomainRegistry::ensure_domain(const std::string& domain) {
    validate_domain_key(domain);
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto                                it = domains_.find(domain);
        if (it != domains_.end())
            return it->second;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = domains_.try_emplace(domain, nullptr);
    if (inserted)
        it->second = std::make_shared<DomainRecord>(domain, default_delay_, codec_);
    return it->second;
}

DomainRecordPtr DomainRegistry::find(const std::string& domain) const {
    validate_domain_key(domain);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto                                it = domains_.find(domain);
    return it == domains_.end() ? nullptr : it->second;
}

std::optional<DomainState> DomainRegistry::get_domain_state(const std::string& domain) const {
    auto record = find(domain);
    if (!record)
        return std::nullopt;
    return record->state();
}

DomainSnapshot DomainRegistry::all_domains() const {
    std::vector<std::string>            keys;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    keys.reserve(domains_.size());
    for (const auto& [key, record] : domains_)
        keys.push_back(key);
    return DomainSnapshot(std::move(keys));
}

std::vector<DomainRecordPtr> DomainRegistry::records() const {
    std::vector<DomainRecordPtr>        out;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(domains_.size());
    for (const auto& [key, record] : domains_)
        out.push_back(record);
    return out;
}

size_t DomainRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return domains_.size();
}

bool DomainRegistry::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return domains_.empty();
}

void DomainRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    domains_.clear();
}

}  // namespace Store
}  // namespace Frontier
