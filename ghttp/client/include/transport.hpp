#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "expected.hpp"
#include "request.hpp"
#include "response.hpp"
#include "trace.hpp"


namespace ghttp {


    struct TransportConfig
    {
        std::chrono::milliseconds connectTimeout{std::chrono::seconds(30)};
        std::chrono::milliseconds totalTimeout{std::chrono::seconds(120)};   // 0 = none
        bool followRedirects{true};
        long maxRedirects{10};
        std::string userAgent{"ghttp/0.1"};
        bool verifyTls{true};

        std::optional<std::string> proxy;       // e.g. "http://127.0.0.1:8080"; unset = environment
        std::optional<std::string> caFile;
        std::optional<std::string> clientCert;  // PEM
        std::optional<std::string> clientKey;   // PEM
    };


    /**
     * @brief Performs a single HTTP exchange.
     *
     * Must honour req.context(): stop early once it is done and report the
     * context's error. Non-2xx statuses are responses, not errors. When
     * hooks is non-null the transport reports connection lifecycle events.
     */
    struct ITransport
    {
        virtual ~ITransport() = default;
        virtual Expected<Response> roundTrip(Request& req, ITraceHooks* hooks) = 0;
        virtual void closeIdleConnections() {}
    };


    // libcurl-backed transport; link curl_transport.cpp.
    std::shared_ptr<ITransport> makeCurlTransport(TransportConfig config = {});


} // namespace ghttp
