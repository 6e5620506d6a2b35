#include "frontier/sampling/sampler.hpp"
#include <algorithm>
#include <iterator>
#include <random>
#include "frontier/core/constants.hpp"
#include "frontier/core/logger.hpp"
#include "frontier/store/url_store.hpp"

namespace Frontier {
namespace Sampling {

using Core::Logger;

std::vector<std::string> sample_urls(const std::vector<std::string>& input_urls,
                                     const SampleOptions&            options) {
    std::vector<std::string> output;

    Store::StoreOptions store_options;
    store_options.compressed = input_urls.size() > Core::Constants::COMPRESSION_THRESHOLD;
    store_options.strict     = options.strict;
    store_options.verbose    = options.verbose;
    Store::UrlStore store(store_options);

    std::vector<std::string> sorted(input_urls);
    std::sort(sorted.begin(), sorted.end());
    store.add_urls(sorted);

    std::mt19937 rng(options.seed ? *options.seed : std::random_device{}());

    for (const auto& domain : store.get_known_domains()) {
        std::vector<std::string> urls;
        for (auto& url : store.find_known_urls(domain)) {
            std::string path = url.substr(domain.size());
            if (path != "/" && !path.empty())
                urls.push_back(std::move(url));
        }

        if (urls.empty() || (options.exclude_min && urls.size() < *options.exclude_min)
            || (options.exclude_max && urls.size() > *options.exclude_max)) {
            Logger::warn("Discarded (size): " + domain + "\turls: " + std::to_string(urls.size()));
            continue;
        }

        std::vector<std::string> picked;
        if (urls.size() > options.size) {
            std::sample(urls.begin(), urls.end(), std::back_inserter(picked), options.size, rng);
            std::sort(picked.begin(), picked.end());
        }
        else {
            picked = urls;
        }

        Logger::debug(domain + "\turls: " + std::to_string(picked.size()) + "\tprop.: "
                      + std::to_string(static_cast<double>(picked.size()) / urls.size()));
        output.insert(output.end(), picked.begin(), picked.end());
    }
    return output;
}

}  // namespace Sampling
}  // namespace Frontier
