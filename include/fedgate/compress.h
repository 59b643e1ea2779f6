#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/compress.h — gzip codec (zlib) for responses and subgraph bodies
// ═══════════════════════════════════════════════════════════════════
//
//  Outgoing: compression() gzips gateway responses for clients that
//  send Accept-Encoding: gzip. Incoming: fetch inflates gzip subgraph
//  bodies with gzipDecompress(), bounded so a small compressed body
//  cannot expand without limit.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace fedgate::compress {

constexpr int kGzipWindowBits = 15 + 16;   // zlib: 16 selects the gzip wrapper
constexpr std::size_t kDefaultInflateLimit = 64 * 1024 * 1024;

class CompressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

// Owns a z_stream set up for one direction; ends it on scope exit
class ZStream {
public:
    enum class Mode { Deflate, Inflate };

    ZStream(Mode mode, int level = Z_DEFAULT_COMPRESSION) : mode_(mode) {
        int rc = mode == Mode::Deflate
            ? deflateInit2(&zs_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY)
            : inflateInit2(&zs_, kGzipWindowBits);
        if (rc != Z_OK) throw CompressionError("zlib initialisation failed (" + std::to_string(rc) + ")");
    }

    ~ZStream() {
        if (mode_ == Mode::Deflate) deflateEnd(&zs_);
        else inflateEnd(&zs_);
    }

    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;

    z_stream* operator->() { return &zs_; }
    z_stream* get() { return &zs_; }

    void input(const std::string& data) {
        zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        zs_.avail_in = static_cast<uInt>(data.size());
    }

private:
    Mode mode_;
    z_stream zs_{};
};

} // namespace detail

inline std::string gzipCompress(const std::string& input, int level = Z_DEFAULT_COMPRESSION) {
    detail::ZStream zs(detail::ZStream::Mode::Deflate, level);
    zs.input(input);

    // deflateBound is large enough for a single Z_FINISH pass
    std::string output(deflateBound(zs.get(), static_cast<uLong>(input.size())), '\0');
    zs->next_out = reinterpret_cast<Bytef*>(output.data());
    zs->avail_out = static_cast<uInt>(output.size());

    if (deflate(zs.get(), Z_FINISH) != Z_STREAM_END) throw CompressionError("gzip compression failed");
    output.resize(zs->total_out);
    return output;
}

// Throws CompressionError on corrupt, truncated or oversized input
inline std::string gzipDecompress(const std::string& input, std::size_t maxOutput = kDefaultInflateLimit) {
    detail::ZStream zs(detail::ZStream::Mode::Inflate);
    zs.input(input);

    std::string output;
    char chunk[16384];
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs->next_out = reinterpret_cast<Bytef*>(chunk);
        zs->avail_out = sizeof(chunk);
        rc = inflate(zs.get(), Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) break;
        output.append(chunk, sizeof(chunk) - zs->avail_out);
        if (output.size() > maxOutput) {
            throw CompressionError("gzip body inflates past " + std::to_string(maxOutput) + " bytes");
        }
    }
    if (rc != Z_STREAM_END) throw CompressionError("gzip stream is corrupt or truncated");
    return output;
}

inline bool isGzip(const std::string& data) {
    return data.size() >= 2 && static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

struct Options {
    int level = Z_DEFAULT_COMPRESSION;
    std::size_t threshold = 1024;   // smaller bodies go out as-is
};

// Gzips the body as it leaves, after every handler and middleware ran
inline http::MiddlewareFunction compression(Options opts = {}) {
    return [opts](http::Request& req, http::Response& res, http::NextFunction next) {
        if (req.header("accept-encoding").find("gzip") != std::string::npos) {
            res.beforeSend([opts](int status, http::Response::Headers& headers, std::string& body) {
                if (status == 204 || body.size() < opts.threshold || headers.count("Content-Encoding")) return;
                body = gzipCompress(body, opts.level);
                headers["Content-Encoding"] = "gzip";
                headers["Vary"] = "Accept-Encoding";
            });
        }
        next();
    };
}

} // namespace fedgate::compress
