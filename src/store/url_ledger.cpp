#include "frontier/store/url_ledger.hpp"

namespace Frontier {
namespace Store {

UrlLedger::UrlLedger(const UrlCodec& codec) : codec_(codec) {
}

const UrlEntry* UrlLedger::find(std::string_view path) const {
    std::string key = codec_.encode(path);
    auto        it  = index_.find(key);
    return it == index_.end() ? nullptr : &*it->second;
}

UrlEntry* UrlLedger::find(std::string_view path) {
    std::string key = codec_.encode(path);
    auto        it  = index_.find(key);
    return it == index_.end() ? nullptr : &*it->second;
}

void UrlLedger::visit(UrlEntry& entry, TimePoint when) {
    entry.visited    = true;
    entry.visited_at = when;
    --unvisited_;
}

AddResult UrlLedger::add(std::string_view path, bool visited, bool prepend, TimePoint now) {
    if (UrlEntry* entry = find(path)) {
        if (visited && !entry->visited) {
            visit(*entry, now);
            ++stale_;
            compact();
            return AddResult::MarkedVisited;
        }
        return AddResult::Unchanged;
    }

    UrlEntry entry;
    entry.path    = codec_.encode(path);
    entry.visited = visited;
    if (visited)
        entry.visited_at = now;

    auto it = prepend ? entries_.insert(entries_.begin(), std::move(entry))
                      : entries_.insert(entries_.end(), std::move(entry));
    index_.emplace(std::string_view(it->path), it);

    if (!visited) {
        if (prepend)
            pending_.push_front(it);
        else
            pending_.push_back(it);
        ++unvisited_;
    }
    return AddResult::Inserted;
}

bool UrlLedger::mark_visited(std::string_view path, TimePoint when) {
    UrlEntry* entry = find(path);
    if (!entry)
        return false;
    if (!entry->visited) {
        visit(*entry, when);
        ++stale_;
        compact();
    }
    return true;
}

bool UrlLedger::contains(std::string_view path) const {
    return find(path) != nullptr;
}

bool UrlLedger::is_visited(std::string_view path) const {
    const UrlEntry* entry = find(path);
    return entry && entry->visited;
}

std::vector<std::string> UrlLedger::known() const {
    std::vector<std::string> paths;
    paths.reserve(entries_.size());
    for (const auto& entry : entries_)
        paths.push_back(codec_.decode(entry.path));
    return paths;
}

std::vector<std::string> UrlLedger::unvisited() const {
    std::vector<std::string> paths;
    paths.reserve(unvisited_);
    for (const auto& it : pending_) {
        if (!it->visited)
            paths.push_back(codec_.decode(it->path));
    }
    return paths;
}

std::optional<std::string> UrlLedger::front_unvisited() {
    prune_front();
    if (pending_.empty())
        return std::nullopt;
    return codec_.decode(pending_.front()->path);
}

std::optional<std::string> UrlLedger::pop_unvisited(TimePoint now) {
    prune_front();
    if (pending_.empty())
        return std::nullopt;

    auto it = pending_.front();
    pending_.pop_front();
    visit(*it, now);
    return codec_.decode(it->path);
}

std::vector<LedgerRecord> UrlLedger::records() const {
    std::vector<LedgerRecord> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_)
        out.push_back({codec_.decode(entry.path), entry.visited, entry.visited_at});
    return out;
}

void UrlLedger::clear() {
    pending_.clear();
    index_.clear();
    entries_.clear();
    unvisited_ = 0;
    stale_     = 0;
}

void UrlLedger::prune_front() {
    while (!pending_.empty() && pending_.front()->visited) {
        pending_.pop_front();
        if (stale_ > 0)
            --stale_;
    }
}

// Drop positions of entries visited out of queue order once they dominate.
void UrlLedger::compact() {
    if (stale_ < COMPACT_MIN_STALE || stale_ * 2 < pending_.size())
        return;

    std::deque<EntryList::iterator> fresh;
    for (const auto& it : pending_) {
        if (!it->visited)
            fresh.push_back(it);
    }
    pending_.swap(fresh);
    stale_ = 0;
}

}  // namespace Store
}  // namespace Frontier
