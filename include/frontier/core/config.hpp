#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "frontier/core/constants.hpp"
#include "frontier/store/url_store.hpp"

namespace Frontier {
namespace Core {

struct Config {
    std::vector<std::string> inputs;  // files, "-" for stdin
    std::string              config_path;

    bool        compressed = false;
    bool        strict     = false;
    bool        verbose    = false;
    std::string language;  // empty: no language filter
    double      delay   = Constants::DEFAULT_CRAWL_DELAY;
    int         threads = Constants::DEFAULT_THREADS;

    size_t                  sample      = 0;  // 0: no sampling
    size_t                  exclude_min = 0;  // 0: no lower bound
    size_t                  exclude_max = 0;  // 0: no upper bound
    std::optional<uint32_t> seed;

    size_t schedule   = 0;  // 0: no schedule
    double time_limit = Constants::DEFAULT_TIME_LIMIT;

    bool        unvisited = false;
    bool        counts    = false;
    bool        dump      = false;
    std::string save_path;
    std::string load_path;

    Store::StoreOptions to_store_options() const;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Frontier
