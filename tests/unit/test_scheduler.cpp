#include <gtest/gtest.h>
#include <map>
#include "frontier/scheduler/scheduler.hpp"

using namespace Frontier;
using namespace Frontier::Store;
using Frontier::Scheduler::ScheduledUrl;

class SchedulerTest : public ::testing::Test {
protected:
    PlainCodec                      codec_;
    DomainRegistry                  registry_{2.0, codec_};
    TimePoint                       now_ = TimePoint(std::chrono::seconds(1700000000));
    Frontier::Scheduler::Scheduler  scheduler_{registry_, [this] { return now_; }};

    void add(const std::string& domain, const std::vector<std::string>& paths) {
        auto record = registry_.ensure_domain(domain);
        for (const auto& path : paths)
            record->add_url(path, false, false, now_);
    }
};

TEST_F(SchedulerTest, DownloadableNowIncludesWaitsWithinLimit) {
    add("https://a.org", {"/1", "/2"});
    add("https://b.org", {"/1", "/2"});
    registry_.find("https://b.org")->pop_next(now_);  // b must now wait 2s

    auto within = scheduler_.downloadable_now(10.0);
    ASSERT_EQ(within.size(), 2);
    EXPECT_EQ(within[0].domain, "https://a.org");
    EXPECT_DOUBLE_EQ(within[0].wait, 0.0);
    EXPECT_EQ(within[1].domain, "https://b.org");
    EXPECT_NEAR(within[1].wait, 2.0, 1e-6);

    auto immediate = scheduler_.downloadable_now(1.0);
    ASSERT_EQ(immediate.size(), 1);
    EXPECT_EQ(immediate[0].domain, "https://a.org");
}

TEST_F(SchedulerTest, ExhaustedDomainsAreNotDownloadable) {
    add("https://a.org", {"/1"});
    registry_.find("https://a.org")->pop_next(now_);
    EXPECT_TRUE(scheduler_.downloadable_now(100.0).empty());
}

TEST_F(SchedulerTest, BuildScheduleInterleavesDomains) {
    add("https://a.org", {"/1", "/2", "/3"});
    add("https://b.org", {"/x"});

    auto plan = scheduler_.build_schedule(10, 10.0);
    ASSERT_EQ(plan.size(), 4);
    EXPECT_EQ(plan[0].url(), "https://a.org/1");
    EXPECT_DOUBLE_EQ(plan[0].wait, 0.0);
    EXPECT_EQ(plan[1].url(), "https://b.org/x");
    EXPECT_DOUBLE_EQ(plan[1].wait, 0.0);
    EXPECT_EQ(plan[2].url(), "https://a.org/2");
    EXPECT_NEAR(plan[2].wait, 2.0, 1e-9);
    EXPECT_EQ(plan[3].url(), "https://a.org/3");
    EXPECT_NEAR(plan[3].wait, 4.0, 1e-9);

    EXPECT_TRUE(registry_.find("https://a.org")->is_exhausted());
    EXPECT_TRUE(registry_.find("https://b.org")->is_exhausted());
}

TEST_F(SchedulerTest, ScheduleRespectsDelayPerDomain) {
    add("https://a.org", {"/1", "/2", "/3", "/4"});
    add("https://b.org", {"/1", "/2", "/3"});
    add("https://c.org", {"/1", "/2"});
    registry_.find("https://c.org")->store_rules("", 3.0);

    auto plan = scheduler_.build_schedule(100, 60.0);
    EXPECT_EQ(plan.size(), 9);

    std::map<std::string, double> last;
    for (const auto& entry : plan) {
        double delay = registry_.find(entry.domain)->state().crawl_delay;
        auto   it    = last.find(entry.domain);
        if (it != last.end())
            EXPECT_GE(entry.wait - it->second, delay - 1e-9);
        last[entry.domain] = entry.wait;
    }
}

TEST_F(SchedulerTest, TimeLimitStopsPlanning) {
    add("https://a.org", {"/1", "/2", "/3"});
    auto plan = scheduler_.build_schedule(10, 3.0);
    ASSERT_EQ(plan.size(), 2);
    EXPECT_EQ(registry_.find("https://a.org")->find_unvisited(), (std::vector<std::string>{"/3"}));
}

TEST_F(SchedulerTest, MaxUrlsCapsPlan) {
    add("https://a.org", {"/1", "/2"});
    add("https://b.org", {"/1", "/2"});
    EXPECT_EQ(scheduler_.build_schedule(3, 100.0).size(), 3);
    EXPECT_TRUE(scheduler_.build_schedule(0, 100.0).empty());
}

TEST_F(SchedulerTest, PlannedFetchesPushBackNextEligibility) {
    add("https://a.org", {"/1", "/2", "/3"});
    scheduler_.build_schedule(2, 10.0);  // fetches at +0 and +2

    auto waits = scheduler_.downloadable_now(10.0);
    ASSERT_EQ(waits.size(), 1);
    EXPECT_NEAR(waits[0].wait, 4.0, 1e-6);
}

TEST_F(SchedulerTest, DirectPopDoesNotReopenPlannedWindow) {
    registry_.ensure_domain("https://a.org")->store_rules("", 5.0);
    add("https://a.org", {"/1", "/2", "/3", "/4"});

    auto first = scheduler_.build_schedule(2, 100.0);
    ASSERT_EQ(first.size(), 2);
    EXPECT_DOUBLE_EQ(first[0].wait, 0.0);
    EXPECT_NEAR(first[1].wait, 5.0, 1e-9);

    EXPECT_EQ(registry_.find("https://a.org")->pop_next(now_), "/3");

    auto second = scheduler_.build_schedule(1, 100.0);
    ASSERT_EQ(second.size(), 1);
    EXPECT_EQ(second[0].url(), "https://a.org/4");
    EXPECT_GE(second[0].wait, first[1].wait + 5.0 - 1e-9);
}

TEST_F(SchedulerTest, ThresholdReached) {
    add("https://a.org", {"/1"});
    EXPECT_FALSE(scheduler_.threshold_reached("https://a.org", 10.0));

    now_ += std::chrono::seconds(30);
    EXPECT_TRUE(scheduler_.threshold_reached("https://a.org", 10.0));
    EXPECT_FALSE(scheduler_.threshold_reached("https://a.org", 60.0));
    EXPECT_FALSE(scheduler_.threshold_reached("https://unknown.org", 0.0));

    registry_.find("https://a.org")->pop_next(now_);
    EXPECT_FALSE(scheduler_.threshold_reached("https://a.org", 0.0));
}

TEST_F(SchedulerTest, RemainingUnvisitedDomainCount) {
    add("https://a.org", {"/1"});
    add("https://b.org", {"/1"});
    EXPECT_EQ(scheduler_.remaining_unvisited_domain_count(), 2);
    registry_.find("https://a.org")->pop_next(now_);
    EXPECT_EQ(scheduler_.remaining_unvisited_domain_count(), 1);
}
