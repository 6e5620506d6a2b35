#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include "frontier/binary/reader.hpp"
#include "frontier/binary/writer.hpp"
#include "frontier/core/logger.hpp"
#include "frontier/store/url_store.hpp"

namespace Frontier {
namespace Store {

using Core::Constants;
using Core::Logger;

namespace {

int64_t to_micros(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint from_micros(int64_t micros) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

void write_time(Binary::Writer& writer, const std::optional<TimePoint>& tp) {
    writer.write_bool(tp.has_value());
    writer.write_int64(tp ? to_micros(*tp) : 0);
}

std::optional<TimePoint> read_time(Binary::Reader& reader) {
    bool    present = reader.read_bool();
    int64_t micros  = reader.read_int64();
    if (!present)
        return std::nullopt;
    return from_micros(micros);
}

}  // namespace

std::vector<DomainDump> UrlStore::snapshot() const {
    std::vector<DomainDump> dumps;
    for (const auto& record : registry_.records()) {
        RecordView view = record->view();

        DomainDump dump;
        dump.domain         = record->key();
        dump.crawl_delay    = view.state.crawl_delay;
        dump.explicit_delay = view.state.explicit_delay;
        if (view.state.has_rules)
            dump.rules = codec_->decode(view.state.rules);
        dump.last_access = view.state.last_access;
        dump.downloads   = view.state.downloads;
        dump.entries     = std::move(view.entries);
        dumps.push_back(std::move(dump));
    }
    return dumps;
}

std::vector<std::string> UrlStore::dump_urls() const {
    std::vector<std::string> urls;
    for (const auto& dump : snapshot()) {
        for (const auto& entry : dump.entries)
            urls.push_back(dump.domain + entry.path);
    }
    return urls;
}

void UrlStore::print_urls(std::ostream& out) const {
    for (const auto& dump : snapshot()) {
        for (const auto& entry : dump.entries)
            out << dump.domain << entry.path << "\tvisited=" << (entry.visited ? "true" : "false")
                << "\n";
    }
    out.flush();
}

void UrlStore::print_unvisited_urls(std::ostream& out) const {
    for (const auto& dump : snapshot()) {
        for (const auto& entry : dump.entries) {
            if (!entry.visited)
                out << dump.domain << entry.path << "\n";
        }
    }
    out.flush();
}

void UrlStore::write_json_lines(std::ostream& out) const {
    for (const auto& dump : snapshot()) {
        for (const auto& entry : dump.entries) {
            nlohmann::json line = {{"url", dump.domain + entry.path}, {"visited", entry.visited}};
            if (entry.visited_at)
                line["visited_at"] = static_cast<double>(to_micros(*entry.visited_at)) / 1e6;
            // URLs are raw bytes; invalid UTF-8 is written as U+FFFD
            out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        }
    }
    out.flush();
}

void UrlStore::save(const std::string& path) const {
    std::vector<uint8_t>    buffer;
    Binary::Writer          writer(buffer);
    std::vector<DomainDump> dumps = snapshot();

    writer.write_raw(Constants::SNAPSHOT_MAGIC);
    writer.write_uint32(Constants::SNAPSHOT_VERSION);
    writer.write_uint64(dumps.size());

    for (const auto& dump : dumps) {
        writer.write_bytes(dump.domain);
        writer.write_double(dump.crawl_delay);
        writer.write_bool(dump.explicit_delay);
        writer.write_bool(dump.rules.has_value());
        writer.write_bytes(dump.rules ? *dump.rules : std::string());
        write_time(writer, dump.last_access);
        writer.write_uint64(dump.downloads);
        writer.write_uint64(dump.entries.size());
        for (const auto& entry : dump.entries) {
            writer.write_bytes(entry.path);
            writer.write_bool(entry.visited);
            write_time(writer, entry.visited_at);
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        throw std::runtime_error("Cannot open " + path + " for writing");
    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    if (!file)
        throw std::runtime_error("Failed to write snapshot to " + path);

    Logger::success("Saved " + std::to_string(dumps.size()) + " domains to " + path);
}

void UrlStore::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot open " + path);
    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());

    // Decode everything before touching the registry so a bad file has no effect.
    std::vector<DomainDump> dumps;
    try {
        Binary::Reader reader(buffer);
        std::string    magic(Constants::SNAPSHOT_MAGIC);
        if (reader.read_raw(magic.size()) != magic)
            throw std::runtime_error("not a frontier snapshot");
        uint32_t version = reader.read_uint32();
        if (version != Constants::SNAPSHOT_VERSION)
            throw std::runtime_error("unsupported snapshot version " + std::to_string(version));

        uint64_t domains = reader.read_uint64();
        for (uint64_t i = 0; i < domains; ++i) {
            DomainDump dump;
            dump.domain         = reader.read_bytes();
            dump.crawl_delay    = reader.read_double();
            dump.explicit_delay = reader.read_bool();
            bool        has_rules = reader.read_bool();
            std::string rules     = reader.read_bytes();
            if (has_rules)
                dump.rules = std::move(rules);
            dump.last_access = read_time(reader);
            dump.downloads   = reader.read_uint64();

            uint64_t entries = reader.read_uint64();
            for (uint64_t j = 0; j < entries; ++j) {
                LedgerRecord entry;
                entry.path       = reader.read_bytes();
                entry.visited    = reader.read_bool();
                entry.visited_at = read_time(reader);
                dump.entries.push_back(std::move(entry));
            }
            dumps.push_back(std::move(dump));
        }
        if (!reader.eof())
            throw std::runtime_error("trailing data");
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Truncated snapshot: " + path);
    }
    catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid snapshot " + path + ": " + e.what());
    }

    if (!registry_.empty())
        throw std::runtime_error("Cannot load " + path + " into a non-empty store");

    TimePoint t = now();
    for (const auto& dump : dumps) {
        if (dump.domain.empty() || dump.entries.empty())
            continue;
        auto record = registry_.ensure_domain(dump.domain);
        for (const auto& entry : dump.entries)
            record->add_url(entry.path, entry.visited, false, entry.visited_at.value_or(t));
        if (dump.rules)
            record->store_rules(codec_->encode(*dump.rules),
                                dump.explicit_delay ? std::optional<double>(dump.crawl_delay)
                                                    : std::nullopt);
        record->restore_access(dump.last_access, dump.downloads);
    }

    Logger::info("Loaded " + std::to_string(dumps.size()) + " domains from " + path);
}

}  // namespace Store
}  // namespace Frontier
