#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "frontier/core/logger.hpp"
#include "frontier/store/url_store.hpp"

using namespace Frontier;
using namespace Frontier::Store;

class PersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_ERROR);
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    StoreOptions options(bool compressed = false) {
        StoreOptions opts;
        opts.compressed = compressed;
        opts.clock      = [this] { return now_; };
        return opts;
    }

    void populate(UrlStore& store) {
        store.add_urls({"https://a.org/1", "https://a.org/2", "https://a.org/3", "https://b.org/x?id=1"});
        store.get_url("https://a.org");
        now_ += std::chrono::seconds(3);
        store.mark_visited("https://a.org/3");
        store.store_rules("https://a.org", "User-agent: *\nCrawl-delay: 2", 2.0);
        store.store_rules("https://b.org", "User-agent: *");
    }

    TimePoint   now_  = TimePoint(std::chrono::seconds(1700000000));
    std::string path_ = "frontier_snapshot_test.bin";
};

TEST_F(PersistenceTest, SaveLoadRoundTrip) {
    UrlStore original(options());
    populate(original);
    original.save(path_);

    UrlStore restored(options());
    restored.load(path_);

    EXPECT_EQ(restored.get_all_counts(), original.get_all_counts());
    EXPECT_EQ(restored.get_known_domains(), original.get_known_domains());
    EXPECT_EQ(restored.dump_urls(), original.dump_urls());
    EXPECT_EQ(restored.find_unvisited_urls("https://a.org"),
              (std::vector<std::string>{"https://a.org/2"}));
    EXPECT_TRUE(restored.has_been_visited("https://a.org/3"));
    EXPECT_EQ(restored.get_rules("https://a.org"), "User-agent: *\nCrawl-delay: 2");
    EXPECT_EQ(restored.get_rules("https://b.org"), "User-agent: *");
    EXPECT_DOUBLE_EQ(restored.get_crawl_delay("https://a.org", 9.0), 2.0);
    EXPECT_DOUBLE_EQ(restored.get_crawl_delay("https://b.org", 9.0), 9.0);
    EXPECT_TRUE(restored.download_threshold_reached(1));

    auto before = original.snapshot();
    auto after  = restored.snapshot();
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].last_access, after[i].last_access);
        ASSERT_EQ(before[i].entries.size(), after[i].entries.size());
        for (size_t j = 0; j < before[i].entries.size(); ++j)
            EXPECT_EQ(before[i].entries[j].visited_at, after[i].entries[j].visited_at);
    }
}

TEST_F(PersistenceTest, CompressedAndPlainShareFormat) {
    UrlStore packed(options(true));
    populate(packed);
    packed.save(path_);

    UrlStore plain(options(false));
    plain.load(path_);
    EXPECT_EQ(plain.dump_urls(), packed.dump_urls());
    EXPECT_EQ(plain.get_rules("https://a.org"), packed.get_rules("https://a.org"));
}

TEST_F(PersistenceTest, LoadIntoNonEmptyStoreFails) {
    UrlStore original(options());
    populate(original);
    original.save(path_);

    UrlStore target(options());
    target.add_urls({"https://c.org/only"});
    EXPECT_THROW(target.load(path_), std::runtime_error);
    EXPECT_EQ(target.dump_urls(), (std::vector<std::string>{"https://c.org/only"}));
}

TEST_F(PersistenceTest, MissingFile) {
    UrlStore store(options());
    EXPECT_THROW(store.load("does_not_exist.bin"), std::runtime_error);
}

TEST_F(PersistenceTest, ForeignFile) {
    std::ofstream(path_) << "definitely not a snapshot";
    UrlStore store(options());
    EXPECT_THROW(store.load(path_), std::runtime_error);
    EXPECT_EQ(store.total_url_count(), 0);
}

TEST_F(PersistenceTest, TruncatedFile) {
    UrlStore original(options());
    populate(original);
    original.save(path_);

    std::ifstream     in(path_, std::ios::binary);
    std::string       bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    std::ofstream(path_, std::ios::binary | std::ios::trunc) << bytes.substr(0, bytes.size() / 2);

    UrlStore store(options());
    EXPECT_THROW(store.load(path_), std::runtime_error);
    EXPECT_EQ(store.total_url_count(), 0);
}

TEST_F(PersistenceTest, EmptyStore) {
    UrlStore empty(options());
    empty.save(path_);

    UrlStore store(options());
    EXPECT_NO_THROW(store.load(path_));
    EXPECT_TRUE(store.get_known_domains().empty());
}

TEST_F(PersistenceTest, SaveToUnwritablePath) {
    UrlStore store(options());
    EXPECT_THROW(store.save("/nonexistent-dir/snapshot.bin"), std::runtime_error);
}
