#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "callbacks.hpp"
#include "expected.hpp"
#include "gates.hpp"
#include "request.hpp"
#include "response.hpp"
#include "transport.hpp"
#include "../../logger/logger.hpp"


namespace ghttp {


    struct ClientConfig
    {
        TransportConfig transport;
        // Null keeps the client silent.
        std::shared_ptr<logger::Logger> logger;

        std::optional<double> rateLimit;        // requests per second
        int rateBurst{1};
        std::optional<std::size_t> maxConcurrency;

        std::ostream* debugStream{nullptr};
        bool debugBody{false};
    };


    /**
     * @brief Runs requests through the callback chain, the retry loop and the transport.
     *
     * Register callbacks before issuing requests; after that a Client may be
     * shared by any number of threads.
     */
    class Client
    {
    public:
        explicit Client(ClientConfig config = {}, std::shared_ptr<ITransport> transport = nullptr);

        // Client over libcurl with ClientConfig defaults.
        static Client withDefaults() { return Client(ClientConfig{}); }

        void registerBeforeRequestCallbacks(const std::vector<std::shared_ptr<IBeforeRequestCallback>>& callbacks);
        void registerAfterResponseCallbacks(const std::vector<std::shared_ptr<IAfterResponseCallback>>& callbacks);

        void enableRateLimiting(std::shared_ptr<RateLimiter> limiter);
        void setMaxConcurrency(std::size_t n);
        void enableDebugging(std::ostream& out, bool body);

        Expected<Response> execute(Request& req);
        // Like execute(), throws std::runtime_error on failure.
        Response mustExecute(Request& req);

        Expected<Response> send(const std::string& method, const std::string& url, const std::vector<RequestHook>& hooks = {});
        Expected<Response> get(const std::string& url, const std::vector<RequestHook>& hooks = {})     { return send(method::get, url, hooks); }
        Expected<Response> head(const std::string& url, const std::vector<RequestHook>& hooks = {})    { return send(method::head, url, hooks); }
        Expected<Response> post(const std::string& url, const std::vector<RequestHook>& hooks = {})    { return send(method::post, url, hooks); }
        Expected<Response> put(const std::string& url, const std::vector<RequestHook>& hooks = {})     { return send(method::put, url, hooks); }
        Expected<Response> patch(const std::string& url, const std::vector<RequestHook>& hooks = {})   { return send(method::patch, url, hooks); }
        Expected<Response> del(const std::string& url, const std::vector<RequestHook>& hooks = {})     { return send(method::del, url, hooks); }
        Expected<Response> options(const std::string& url, const std::vector<RequestHook>& hooks = {}) { return send(method::options, url, hooks); }

        void closeIdleConnections() { transport_->closeIdleConnections(); }

        const std::shared_ptr<ITransport>& transport() const noexcept { return transport_; }
        const std::shared_ptr<logger::Logger>& logger() const noexcept { return logger_; }

    private:
        Expected<void> onBeforeRequest(Request& req);
        Expected<Response> doWithRetry(Request& req);
        Expected<Response> roundTrip(Request& req, const std::shared_ptr<ClientTrace>& trace);
        void onAfterResponse(Response* resp, const Error* err);

        std::shared_ptr<ITransport> transport_;
        std::shared_ptr<logger::Logger> logger_;
        std::vector<std::shared_ptr<IBeforeRequestCallback>> before_;
        std::vector<std::shared_ptr<IAfterResponseCallback>> after_;
    };


} // namespace ghttp
