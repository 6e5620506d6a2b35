#pragma once
#include <deque>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "domain_state.hpp"
#include "url_codec.hpp"

namespace Frontier {
namespace Store {

struct UrlEntry {
    std::string              path;  // encoded, immutable once inserted
    bool                     visited = false;
    std::optional<TimePoint> visited_at;
};

// Decoded view of an entry, used for snapshots and persistence.
struct LedgerRecord {
    std::string              path;
    bool                     visited = false;
    std::optional<TimePoint> visited_at;
};

enum class AddResult { Inserted, MarkedVisited, Unchanged };

/**
 * Known URL paths of a single domain, in crawl order.
 *
 * One list holds every entry exactly once. The index maps encoded paths to
 * list positions for O(1) membership, and a deque of positions forms the
 * unvisited queue. Entries visited out of order are left in the deque and
 * skipped on the way out. Not synchronized: DomainRecord owns the lock.
 */
class UrlLedger {
public:
    explicit UrlLedger(const UrlCodec& codec);

    UrlLedger(const UrlLedger&)            = delete;
    UrlLedger& operator=(const UrlLedger&) = delete;

    AddResult add(std::string_view path, bool visited, bool prepend, TimePoint now);
    bool      mark_visited(std::string_view path, TimePoint when);

    bool contains(std::string_view path) const;
    bool is_visited(std::string_view path) const;

    std::vector<std::string> known() const;
    std::vector<std::string> unvisited() const;

    std::optional<std::string> front_unvisited();
    std::optional<std::string> pop_unvisited(TimePoint now);

    std::vector<LedgerRecord> records() const;

    size_t size() const {
        return entries_.size();
    }
    size_t unvisited_count() const {
        return unvisited_;
    }
    bool exhausted() const {
        return unvisited_ == 0;
    }

    void clear();

private:
    using EntryList = std::list<UrlEntry>;

    static constexpr size_t COMPACT_MIN_STALE = 64;

    const UrlCodec&                                             codec_;
    EntryList                                                   entries_;
    std::unordered_map<std::string_view, EntryList::iterator> index_;
    std::deque<EntryList::iterator>                             pending_;
    size_t                                                      unvisited_ = 0;
    size_t                                                      stale_     = 0;

    const UrlEntry* find(std::string_view path) const;
    UrlEntry*       find(std::string_view path);

    void visit(UrlEntry& entry, TimePoint when);
    void prune_front();
    void compact();
};

}  // namespace Store
}  // namespace Frontier
