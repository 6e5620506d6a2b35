#include "frontier/store/url_codec.hpp"
#include <zlib.h>
#include <cstring>
#include <vector>
#include "frontier/core/constants.hpp"
#include "frontier/core/errors.hpp"

namespace Frontier {
namespace Store {

ZlibCodec::ZlibCodec(int level) : level_(level) {
}

// Raw deflate stream, no zlib header: short URL paths gain a few bytes each.
std::string ZlibCodec::encode(std::string_view plain) const {
    z_stream zs;
    memset(&zs, 0, sizeof(zs));

    if (deflateInit2(&zs, level_, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw CodecError("deflateInit2 failed");
    }

    zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(plain.data()));
    zs.avail_in = static_cast<uInt>(plain.size());

    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(plain.size())));
    zs.next_out  = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&zs, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&zs);
        throw CodecError("deflate failed: " + std::to_string(ret));
    }

    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

std::string ZlibCodec::decode(std::string_view encoded) const {
    if (encoded.empty())
        return "";

    z_stream zs;
    memset(&zs, 0, sizeof(zs));

    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw CodecError("inflateInit2 failed");
    }

    zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(encoded.data()));
    zs.avail_in = static_cast<uInt>(encoded.size());

    std::string decompressed;
    char        buffer[4096];

    int ret;
    do {
        zs.next_out  = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        ret = inflate(&zs, Z_NO_FLUSH);

        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            throw CodecError("inflate failed: " + std::to_string(ret));
        }

        size_t have = sizeof(buffer) - zs.avail_out;
        decompressed.append(buffer, have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return decompressed;
}

std::unique_ptr<UrlCodec> make_codec(bool compressed) {
    if (compressed)
        return std::make_unique<ZlibCodec>(Core::Constants::COMPRESSION_LEVEL);
    return std::make_unique<PlainCodec>();
}

}  // namespace Store
}  // namespace Frontier
