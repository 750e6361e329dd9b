#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vrcproxy {
namespace protocol {

// Whole-buffer zlib codecs for HTTP content codings.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    static Encoding ParseContentEncoding(const std::string& v);

    static const size_t kNoLimit = SIZE_MAX;

    // Fails once the decoded output would exceed maxOutput bytes.
    static bool Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out,
                           size_t maxOutput = kNoLimit);
    static bool Decompress(Encoding enc, const std::string& in, std::string* out,
                           size_t maxOutput = kNoLimit);

    static bool Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace vrcproxy
