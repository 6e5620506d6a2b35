#pragma once
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace Frontier {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.3.0";

    static constexpr double DEFAULT_CRAWL_DELAY   = 5.0;   // seconds between two fetches
    static constexpr double DEFAULT_TIME_LIMIT    = 10.0;  // seconds of lookahead
    static constexpr int    DEFAULT_SCHEDULE_SIZE = 100;
    static constexpr int    DEFAULT_DOWNLOAD_URLS = 10000;
    static constexpr int    DEFAULT_THREADS       = 2;

    // Inputs larger than this switch the sampler to compressed storage
    static constexpr size_t COMPRESSION_THRESHOLD = 1000000;
    static constexpr int    COMPRESSION_LEVEL     = 6;

    static constexpr size_t URL_CACHE_SIZE = 1024;
    static constexpr size_t MAX_URL_LENGTH = 2048;

    static constexpr const char* SNAPSHOT_MAGIC   = "FRNT";
    static constexpr uint32_t    SNAPSHOT_VERSION = 1;
};

inline const std::set<std::string>& get_domain_blacklist() {
    static const std::set<std::string> blacklist = {
        "360",        "akamai",     "aliexpress", "amzn",      "amazon",    "amazonaws",
        "baidu",      "bit",        "bongacams",  "chaturbate", "cloudfront", "daftsex",
        "delicious",  "digg",       "ebay",       "ebay-kleinanzeigen",      "facebook",
        "feedburner", "flickr",     "gettyimages", "gmx",      "google",    "gravatar",
        "http",       "imgur",      "immobilienscout24",       "instagr",   "instagram",
        "jd",         "last",       "linkedin",   "live",      "livejasmin", "localhost",
        "mail",       "naver",      "netflix",    "office",    "ok",        "onlyfans",
        "otto",       "paypal",     "pinterest",  "pornhub",   "postbank",  "qq",
        "reddit",     "redtube",    "sina",       "sohu",      "soundcloud", "spankbang",
        "taobao",     "telegram",   "tiktok",     "tmall",     "tnaflix",   "twitch",
        "twitter",    "twitpic",    "txxx",       "vk",        "vkontakte", "vimeo",
        "web",        "weibo",      "whatsapp",   "xhamster",  "xnxx",      "xvideos",
        "yahoo",      "yandex",     "youjizz",    "youporn",   "youtube",   "youtu",
        "zoom"};
    return blacklist;
}

inline const std::set<std::string>& get_allowed_params() {
    static const std::set<std::string> params = {"aid",
                                                 "article_id",
                                                 "artnr",
                                                 "id",
                                                 "itemid",
                                                 "objectid",
                                                 "p",
                                                 "page",
                                                 "pagenum",
                                                 "page_id",
                                                 "pid",
                                                 "post",
                                                 "postid",
                                                 "product_id"};
    return params;
}

inline const std::set<std::string>& get_control_params() {
    static const std::set<std::string> params = {"lang", "language"};
    return params;
}

inline const std::set<std::string>& get_language_aliases(const std::string& language) {
    static const std::set<std::string> de    = {"de", "deutsch", "ger", "german"};
    static const std::set<std::string> en    = {"en", "english", "eng"};
    static const std::set<std::string> empty = {};
    if (language == "de")
        return de;
    if (language == "en")
        return en;
    return empty;
}

}  // namespace Core
}  // namespace Frontier
