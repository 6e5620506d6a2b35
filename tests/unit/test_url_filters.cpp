#include <gtest/gtest.h>
#include "frontier/utils/url_filters.hpp"

using namespace Frontier::Utils;

TEST(UrlFiltersTest, CanonicalizeNormalizes) {
    auto c = canonicalize("  HTTP://Example.ORG:80/a?b=2&a=1#frag ");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->domain, "http://example.org");
    EXPECT_EQ(c->path, "/a?a=1&b=2#frag");
    EXPECT_EQ(c->url, "http://example.org/a?a=1&b=2#frag");
}

TEST(UrlFiltersTest, CanonicalizeKeepsPortsAndRoot) {
    auto c = canonicalize("https://example.org:8443");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->domain, "https://example.org:8443");
    EXPECT_EQ(c->path, "/");

    auto dot = canonicalize("https://example.org./x");
    ASSERT_TRUE(dot.has_value());
    EXPECT_EQ(dot->domain, "https://example.org");

    auto local = canonicalize("http://localhost:3000/app");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->domain, "http://localhost:3000");

    EXPECT_TRUE(canonicalize("http://[::1]:8080/x").has_value());
    EXPECT_TRUE(canonicalize("http://192.168.0.1/x").has_value());
}

TEST(UrlFiltersTest, CanonicalizeRejects) {
    EXPECT_FALSE(canonicalize("").has_value());
    EXPECT_FALSE(canonicalize("/relative/path").has_value());
    EXPECT_FALSE(canonicalize("ftp://example.org/file").has_value());
    EXPECT_FALSE(canonicalize("mailto:someone@example.org").has_value());
    EXPECT_FALSE(canonicalize("https://intranet/page").has_value());
    EXPECT_FALSE(canonicalize("https://example.org:abc/").has_value());
    EXPECT_FALSE(canonicalize("https://exa mple.org/").has_value());
    EXPECT_FALSE(canonicalize("https://example.org/" + std::string(5000, 'a')).has_value());
}

TEST(UrlFiltersTest, StrictDropsTrackingAndFragment) {
    CanonicalizeOptions strict;
    strict.strict = true;

    auto c = canonicalize("https://example.org/p?utm_source=feed&id=7&lang=de#comments", strict);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->path, "/p?id=7&lang=de");

    auto bare = canonicalize("https://example.org/p?fbclid=123", strict);
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->path, "/p");
}

TEST(UrlFiltersTest, NavigationPages) {
    EXPECT_TRUE(is_navigation_page("https://example.org/category/news"));
    EXPECT_TRUE(is_navigation_page("https://example.org/tag/cpp/"));
    EXPECT_TRUE(is_navigation_page("https://example.org/blog/page/2"));
    EXPECT_TRUE(is_navigation_page("https://example.org/archives/2020"));
    EXPECT_TRUE(is_navigation_page("https://example.org/list?page=3"));
    EXPECT_FALSE(is_navigation_page("https://example.org/article/hello-world"));
    EXPECT_FALSE(is_navigation_page("https://example.org/?p=123"));
}

TEST(UrlFiltersTest, NotCrawlable) {
    EXPECT_TRUE(is_not_crawlable("https://example.org/login"));
    EXPECT_TRUE(is_not_crawlable("https://example.org/account/settings"));
    EXPECT_TRUE(is_not_crawlable("https://example.org/wp-admin/edit.php"));
    EXPECT_TRUE(is_not_crawlable("https://example.org/feed/"));
    EXPECT_TRUE(is_not_crawlable("https://example.org/post?share=twitter"));
    EXPECT_FALSE(is_not_crawlable("https://example.org/articles/logistics"));
    EXPECT_FALSE(is_not_crawlable("https://example.org/feedback-form"));
}

TEST(UrlFiltersTest, MatchesLanguage) {
    EXPECT_TRUE(matches_language("https://example.org/de/seite", "de"));
    EXPECT_FALSE(matches_language("https://example.org/en/page", "de"));
    EXPECT_TRUE(matches_language("https://example.org/en-us/page", "en"));
    EXPECT_TRUE(matches_language("https://example.org/page?lang=de", "de"));
    EXPECT_TRUE(matches_language("https://example.org/page?language=german", "de"));
    EXPECT_FALSE(matches_language("https://example.org/page?lang=en", "de"));
    EXPECT_TRUE(matches_language("https://example.org/about", "de"));
    EXPECT_TRUE(matches_language("https://example.org/en/page", std::nullopt));
}

TEST(UrlFiltersTest, StrictLanguageChecksSubdomain) {
    EXPECT_TRUE(matches_language("https://en.example.org/page", "de"));
    EXPECT_FALSE(matches_language("https://en.example.org/page", "de", true));
    EXPECT_TRUE(matches_language("https://de.example.org/page", "de", true));
}

TEST(UrlFiltersTest, CanonicalizeAppliesLanguage) {
    CanonicalizeOptions options;
    options.language = "en";
    EXPECT_TRUE(canonicalize("https://example.org/en/page", options).has_value());
    EXPECT_FALSE(canonicalize("https://example.org/de/seite", options).has_value());
}
