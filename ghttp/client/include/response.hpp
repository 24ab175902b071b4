#pragma once
#include <memory>
#include <optional>
#include <string>
#include "types.hpp"
#include "body.hpp"
#include "trace.hpp"
#include "expected.hpp"


namespace ghttp {


    /**
     * @brief Result of one round trip.
     *
     * The body is single-consumer: read it through content()/text()/saveFile()
     * or close() it. The client may swap it for a decoding wrapper.
     */
    class Response
    {
    public:
        Response() = default;
        Response(Response&&) = default;
        Response& operator=(Response&&) = default;

        int statusCode{0};
        std::string status;             // e.g. "200 OK"
        std::string proto{"HTTP/1.1"};
        HeaderMap headers;
        BodyPtr body;
        std::string effectiveUrl;

        std::optional<std::string> header(std::string_view name) const { return headers.get(name); }

        // Reads the body until end of stream and closes it.
        Expected<std::string> content();
        Expected<std::string> text() { return content(); }
        Expected<void> saveFile(const std::string& path);
        void close();

        // Set by the client when the request had tracing enabled.
        std::shared_ptr<ClientTrace> clientTrace;
        std::optional<TraceInfo> traceInfo() const;
    };


} // namespace ghttp
