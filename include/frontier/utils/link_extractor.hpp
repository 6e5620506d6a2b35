#pragma once
#include <string>
#include <vector>

namespace Frontier {
namespace Utils {
namespace Text {

class LinkExtractor {
public:
    // href values of every <a> element, in document order.
    static std::vector<std::string> extract_links(const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Frontier
