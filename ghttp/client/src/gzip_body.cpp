#include "../include/gzip_body.hpp"


namespace ghttp {


    namespace {

        constexpr std::size_t kGzipHeaderLen = 10;
        constexpr std::size_t kChunk = 32 * 1024;

        Expected<std::size_t> readFull(IBodyReader& body, char* dst, std::size_t len) {
            std::size_t got = 0;
            while (got < len) {
                auto r = body.read(dst + got, len - got);
                if (!r.has_value()) return r;
                if (r.get() == 0) break;
                got += r.get();
            }
            return Expected<std::size_t>::success(got);
        }

    } // namespace


    GzipBody::GzipBody(BodyPtr inner, std::string prefix)
        : inner_(std::move(inner)), in_(std::move(prefix)) {}


    Expected<BodyPtr> GzipBody::create(BodyPtr compressed) {
        if (!compressed) return Expected<BodyPtr>::failure(ErrorKind::stream, "gzip: nil body");

        std::string header(kGzipHeaderLen, '\0');
        auto got = readFull(*compressed, header.data(), header.size());
        if (!got.has_value()) {
            compressed->close();
            return Expected<BodyPtr>::failure(ErrorKind::stream, "gzip: " + got.error->message);
        }
        if (got.get() == 0) {
            compressed->close();
            return Expected<BodyPtr>::failure(ErrorKind::stream, "EOF");
        }
        if (got.get() < kGzipHeaderLen) {
            compressed->close();
            return Expected<BodyPtr>::failure(ErrorKind::stream, "unexpected EOF");
        }

        auto b = reinterpret_cast<const unsigned char*>(header.data());
        if (b[0] != 0x1f || b[1] != 0x8b || b[2] != Z_DEFLATED) {
            compressed->close();
            return Expected<BodyPtr>::failure(ErrorKind::stream, "gzip: invalid header");
        }

        std::unique_ptr<GzipBody> body(new GzipBody(std::move(compressed), std::move(header)));
        // 16 + MAX_WBITS: expect a gzip wrapper, not raw or zlib-wrapped deflate
        if (inflateInit2(&body->strm_, 16 + MAX_WBITS) != Z_OK) {
            std::string msg = body->strm_.msg ? body->strm_.msg : "inflateInit2 failed";
            body->close();
            return Expected<BodyPtr>::failure(ErrorKind::stream, "gzip: " + msg);
        }
        body->initialized_ = true;
        return Expected<BodyPtr>::success(std::move(body));
    }


    GzipBody::~GzipBody() {
        close();
    }


    void GzipBody::close() {
        if (closed_) return;
        closed_ = true;
        if (initialized_) {
            inflateEnd(&strm_);
            initialized_ = false;
        }
        if (inner_) inner_->close();
    }


    Expected<std::size_t> GzipBody::read(char* dst, std::size_t len) {
        if (closed_) return Expected<std::size_t>::failure(ErrorKind::stream, "gzip: read on closed body");
        if (finished_ || len == 0) return Expected<std::size_t>::success(0);

        for (;;) {
            if (in_.empty() && !innerEof_) {
                std::string chunk(kChunk, '\0');
                auto r = inner_->read(chunk.data(), chunk.size());
                if (!r.has_value()) return r;
                if (r.get() == 0) innerEof_ = true;
                chunk.resize(r.get());
                in_ = std::move(chunk);
            }

            strm_.next_in = reinterpret_cast<Bytef*>(in_.data());
            strm_.avail_in = static_cast<uInt>(in_.size());
            strm_.next_out = reinterpret_cast<Bytef*>(dst);
            strm_.avail_out = static_cast<uInt>(len);

            int ret = inflate(&strm_, Z_NO_FLUSH);
            in_.erase(0, in_.size() - strm_.avail_in);
            std::size_t produced = len - strm_.avail_out;

            if (ret == Z_STREAM_END) {
                // Concatenated members continue the same stream.
                if (in_.empty() && !innerEof_) {
                    std::string chunk(kChunk, '\0');
                    auto r = inner_->read(chunk.data(), chunk.size());
                    if (!r.has_value()) return r;
                    if (r.get() == 0) innerEof_ = true;
                    chunk.resize(r.get());
                    in_ = std::move(chunk);
                }
                if (in_.empty()) finished_ = true;
                else inflateReset(&strm_);

                if (produced > 0 || finished_) return Expected<std::size_t>::success(produced);
                continue;
            }
            if (ret != Z_OK && ret != Z_BUF_ERROR) {
                return Expected<std::size_t>::failure(ErrorKind::stream,
                    std::string("gzip: ") + (strm_.msg ? strm_.msg : "invalid data"));
            }
            if (produced > 0) return Expected<std::size_t>::success(produced);
            if (innerEof_ && in_.empty()) {
                return Expected<std::size_t>::failure(ErrorKind::stream, "unexpected EOF");
            }
        }
    }


} // namespace ghttp
