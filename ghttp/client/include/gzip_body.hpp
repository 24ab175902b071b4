#pragma once
#include <memory>
#include <string>
#include <zlib.h>
#include "body.hpp"
#include "expected.hpp"


namespace ghttp {


    /**
     * @brief Inflates a gzip-encoded response body on the fly.
     *
     * Owns the compressed body; close() closes it. create() validates the
     * gzip member header up front so a bad stream fails the attempt instead
     * of the first read.
     */
    class GzipBody : public IBodyReader
    {
    public:
        static Expected<BodyPtr> create(BodyPtr compressed);
        ~GzipBody() override;

        GzipBody(const GzipBody&) = delete;
        GzipBody& operator=(const GzipBody&) = delete;

        Expected<std::size_t> read(char* dst, std::size_t len) override;
        void close() override;

    private:
        GzipBody(BodyPtr inner, std::string prefix);

        BodyPtr inner_;
        z_stream strm_{};
        bool initialized_{false};
        bool finished_{false};
        bool innerEof_{false};
        bool closed_{false};

        std::string in_;    // compressed bytes not yet consumed by inflate
    };


} // namespace ghttp
