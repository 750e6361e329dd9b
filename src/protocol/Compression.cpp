#include "vrcproxy/protocol/Compression.h"
#include "vrcproxy/protocol/HttpHeaders.h"

#include <cstring>

#include <zlib.h>

namespace vrcproxy {
namespace protocol {

const size_t Compression::kNoLimit;

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = ToLowerCopy(v);
    if (lv.empty() || lv == "identity") return Encoding::kIdentity;
    if (HeaderHasToken(lv, "gzip") || HeaderHasToken(lv, "x-gzip")) return Encoding::kGzip;
    if (HeaderHasToken(lv, "deflate")) return Encoding::kDeflate;
    return Encoding::kUnknown;
}

static bool InflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out, size_t maxOutput) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (inflateInit2(&zs, windowBits) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced > maxOutput - out->size()) {
            inflateEnd(&zs);
            out->clear();
            return false;
        }
        if (produced) out->append(buf, buf + produced);
        // Truncated input: no progress possible without more bytes.
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0) {
            inflateEnd(&zs);
            return false;
        }
    }
    inflateEnd(&zs);
    return true;
}

static bool DeflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

bool Compression::Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out,
                             size_t maxOutput) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            if (len > maxOutput) return false;
            out->assign(reinterpret_cast<const char*>(data), len);
            return true;
        case Encoding::kGzip:
            return InflateAll(data, len, 16 + MAX_WBITS, out, maxOutput);
        case Encoding::kDeflate:
            // "deflate" is meant to be zlib-wrapped, but raw streams exist in the wild.
            return InflateAll(data, len, MAX_WBITS, out, maxOutput) ||
                   InflateAll(data, len, -MAX_WBITS, out, maxOutput);
        default:
            return false;
    }
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out, size_t maxOutput) {
    return Decompress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out, maxOutput);
}

bool Compression::Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            out->assign(reinterpret_cast<const char*>(data), len);
            return true;
        case Encoding::kGzip:
            return DeflateAll(data, len, 16 + MAX_WBITS, out);
        case Encoding::kDeflate:
            return DeflateAll(data, len, MAX_WBITS, out);
        default:
            return false;
    }
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    return Compress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out);
}

} // namespace protocol
} // namespace vrcproxy
