#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "domain_state.hpp"
#include "url_codec.hpp"
#include "url_ledger.hpp"

namespace Frontier {
namespace Store {

// State and entries of a domain read under one lock.
struct RecordView {
    DomainState               state;
    std::vector<LedgerRecord> entries;
};

struct PlannedPop {
    std::string path;
    TimePoint   slot;
};

/**
 * State and ledger of one domain behind a single mutex. Every public
 * member locks, so each call is atomic with respect to the domain.
 */
class DomainRecord {
public:
    DomainRecord(std::string key, double default_delay, const UrlCodec& codec);

    DomainRecord(const DomainRecord&)            = delete;
    DomainRecord& operator=(const DomainRecord&) = delete;

    const std::string& key() const {
        return key_;
    }

    AddResult add_url(std::string_view path, bool visited, bool prepend, TimePoint now);
    bool      mark_visited(std::string_view path, TimePoint when);

    bool is_known(std::string_view path) const;
    bool has_been_visited(std::string_view path) const;

    std::vector<std::string> find_known() const;
    std::vector<std::string> find_unvisited() const;

    std::optional<std::string> peek_next();
    std::optional<std::string> pop_next(TimePoint now);
    // Pops only if the last access is absent or at least `min_gap` seconds before `now`.
    std::optional<std::string> pop_if_due(TimePoint now, double min_gap);
    // Pops for a fetch at the earliest slot that is not before `not_before` and
    // respects the crawl delay. Nothing is popped if that slot is after `latest`.
    std::optional<PlannedPop> pop_planned(TimePoint now, TimePoint not_before, TimePoint latest);

    bool is_exhausted() const;

    DomainState state() const;

    void                       store_rules(const std::string& encoded, std::optional<double> delay);
    std::optional<std::string> rules() const;

    std::vector<LedgerRecord> records() const;
    RecordView                view() const;

    // Used when reloading a dump: restores bookkeeping that add_url cannot infer.
    void restore_access(std::optional<TimePoint> last_access, size_t downloads);

private:
    std::string        key_;
    mutable std::mutex mutex_;
    DomainState        state_;
    UrlLedger          ledger_;

    void                       update_status(TimePoint now);
    std::optional<std::string> pop_locked(TimePoint now, TimePoint fetch_at);
};

using DomainRecordPtr = std::shared_ptr<DomainRecord>;

// Restartable snapshot of registry keys, taken at construction.
class DomainSnapshot {
public:
    explicit DomainSnapshot(std::vector<std::string> keys) : keys_(std::move(keys)) {
    }

    std::vector<std::string>::const_iterator begin() const {
        return keys_.begin();
    }
    std::vector<std::string>::const_iterator end() const {
        return keys_.end();
    }
    size_t size() const {
        return keys_.size();
    }
    bool empty() const {
        return keys_.empty();
    }
    const std::vector<std::string>& keys() const {
        return keys_;
    }

private:
    std::vector<std::string> keys_;
};

class DomainRegistry {
public:
    DomainRegistry(double default_delay, const UrlCodec& codec);

    DomainRecordPtr            ensure_domain(const std::string& domain);
    DomainRecordPtr            find(const std::string& domain) const;
    std::optional<DomainState> get_domain_state(const std::string& domain) const;

    DomainSnapshot               all_domains() const;
    std::vector<DomainRecordPtr> records() const;

    size_t size() const;
    bool   empty() const;
    void   clear();

    double default_delay() const {
        return default_delay_;
    }

private:
    double          default_delay_;
    const UrlCodec& codec_;

    mutable std::shared_mutex                      mutex_;
    std::map<std::string, DomainRecordPtr> domains_;
};

void validate_domain_key(const std::string& domain);

}  // namespace Store
}  // namespace Frontier
