#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace Frontier {
namespace Store {

// Storage strategy for URL paths and rule blobs. Encoding must be
// deterministic: lookups encode the probe and compare the stored bytes.
class UrlCodec {
public:
    virtual ~UrlCodec() = default;

    virtual std::string encode(std::string_view plain) const   = 0;
    virtual std::string decode(std::string_view encoded) const = 0;
    virtual bool        compressed() const                     = 0;
};

class PlainCodec : public UrlCodec {
public:
    std::string encode(std::string_view plain) const override {
        return std::string(plain);
    }
    std::string decode(std::string_view encoded) const override {
        return std::string(encoded);
    }
    bool compressed() const override {
        return false;
    }
};

class ZlibCodec : public UrlCodec {
public:
    explicit ZlibCodec(int level);

    std::string encode(std::string_view plain) const override;
    std::string decode(std::string_view encoded) const override;
    bool        compressed() const override {
        return true;
    }

private:
    int level_;
};

std::unique_ptr<UrlCodec> make_codec(bool compressed);

}  // namespace Store
}  // namespace Frontier
