#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Frontier {
namespace Sampling {

struct SampleOptions {
    size_t                  size = 1;  // URLs kept per domain
    std::optional<size_t>   exclude_min;
    std::optional<size_t>   exclude_max;
    bool                    strict  = false;
    bool                    verbose = false;
    std::optional<uint32_t> seed;
};

/**
 * Samples at most `size` URLs per domain from `input_urls`. Domains with
 * fewer than `exclude_min` or more than `exclude_max` URLs are dropped, as
 * are bare homepages. Output is grouped by domain in key order; each
 * domain's sample is sorted.
 */
std::vector<std::string> sample_urls(const std::vector<std::string>& input_urls,
                                     const SampleOptions&            options);

}  // namespace Sampling
}  // namespace Frontier
