#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "frontier/core/logger.hpp"
#include "frontier/sampling/sampler.hpp"

using namespace Frontier::Sampling;

class SamplingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Frontier::Core::Logger::set_level(Frontier::Core::LOG_NONE);
    }
    void TearDown() override {
        Frontier::Core::Logger::set_level(Frontier::Core::LOG_DEFAULT);
    }

    static std::vector<std::string> pages(const std::string& domain, int count) {
        std::vector<std::string> urls;
        for (int i = 0; i < count; ++i)
            urls.push_back(domain + "/page" + std::to_string(i));
        return urls;
    }

    static size_t count_prefix(const std::vector<std::string>& urls, const std::string& prefix) {
        return std::count_if(urls.begin(), urls.end(), [&prefix](const std::string& u) {
            return u.rfind(prefix, 0) == 0;
        });
    }
};

TEST_F(SamplingTest, CapsEachDomain) {
    auto input = pages("https://a.org", 20);
    auto more  = pages("https://b.org", 3);
    input.insert(input.end(), more.begin(), more.end());

    SampleOptions options;
    options.size = 5;
    options.seed = 1;
    auto output  = sample_urls(input, options);

    EXPECT_EQ(count_prefix(output, "https://a.org/"), 5);
    EXPECT_EQ(count_prefix(output, "https://b.org/"), 3);
    EXPECT_EQ(output.size(), 8);
}

TEST_F(SamplingTest, GroupedByDomainAndSorted) {
    auto input = pages("https://b.org", 10);
    auto more  = pages("https://a.org", 10);
    input.insert(input.end(), more.begin(), more.end());
    std::reverse(input.begin(), input.end());

    SampleOptions options;
    options.size = 4;
    options.seed = 3;
    auto output  = sample_urls(input, options);

    ASSERT_EQ(output.size(), 8);
    EXPECT_TRUE(std::all_of(output.begin(), output.begin() + 4, [](const std::string& u) {
        return u.rfind("https://a.org/", 0) == 0;
    }));
    EXPECT_TRUE(std::is_sorted(output.begin(), output.begin() + 4));
    EXPECT_TRUE(std::is_sorted(output.begin() + 4, output.end()));
}

TEST_F(SamplingTest, HomepagesExcluded) {
    std::vector<std::string> input = {"https://a.org/", "https://a.org", "https://a.org/x", "https://c.org/"};

    SampleOptions options;
    options.size = 10;
    auto output  = sample_urls(input, options);

    EXPECT_EQ(output, (std::vector<std::string>{"https://a.org/x"}));
}

TEST_F(SamplingTest, ExcludeBounds) {
    auto input = pages("https://small.org", 2);
    auto mid   = pages("https://mid.org", 5);
    auto big   = pages("https://big.org", 50);
    input.insert(input.end(), mid.begin(), mid.end());
    input.insert(input.end(), big.begin(), big.end());

    SampleOptions options;
    options.size        = 100;
    options.exclude_min = 3;
    options.exclude_max = 10;
    auto output         = sample_urls(input, options);

    EXPECT_EQ(count_prefix(output, "https://small.org/"), 0);
    EXPECT_EQ(count_prefix(output, "https://mid.org/"), 5);
    EXPECT_EQ(count_prefix(output, "https://big.org/"), 0);
}

TEST_F(SamplingTest, SeedIsDeterministic) {
    auto input = pages("https://a.org", 100);

    SampleOptions options;
    options.size = 10;
    options.seed = 1234;

    EXPECT_EQ(sample_urls(input, options), sample_urls(input, options));
}

TEST_F(SamplingTest, InvalidInputsDropped) {
    std::vector<std::string> input = {"not a url", "ftp://a.org/file", "https://a.org/ok"};

    SampleOptions options;
    options.size = 5;
    EXPECT_EQ(sample_urls(input, options), (std::vector<std::string>{"https://a.org/ok"}));
}

TEST_F(SamplingTest, EmptyInput) {
    EXPECT_TRUE(sample_urls({}, SampleOptions{}).empty());
}
