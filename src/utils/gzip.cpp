#include "utils/gzip.h"

#include <algorithm>
#include <cctype>
#include <zlib.h>

namespace chatgw {

namespace {
// windowBits 15 plus 16 selects the gzip wrapper
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
}  // namespace

bool accepts_gzip(std::string_view accept_encoding) {
    std::string lower(accept_encoding);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("gzip") != std::string::npos;
}

std::optional<std::string> gzip_compress(std::string_view input) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    std::string output;
    output.resize(deflateBound(&zs, static_cast<uLong>(input.size())));

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = reinterpret_cast<Bytef*>(output.data());
    zs.avail_out = static_cast<uInt>(output.size());

    // deflateBound leaves room for the whole stream, so one call finishes it
    const int ret = deflate(&zs, Z_FINISH);
    const auto produced = zs.total_out;
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }
    output.resize(produced);
    return output;
}

}  // namespace chatgw
