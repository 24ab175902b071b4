#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"
#include "body.hpp"
#include "context.hpp"
#include "expected.hpp"


namespace ghttp {

    class Retrier;
    class FormData;
    using RetryOption = std::function<void(Retrier&)>;


    struct Url
    {
        std::string scheme;     // lower-case
        std::string host;       // host[:port] as written
        std::string path{"/"};  // path and query (request-target)
    };

    // Accepts absolute http, https and file URLs.
    Expected<Url> parseUrl(std::string_view raw);


    /**
     * @brief Mutable request envelope handed to Client::execute.
     *
     * Bodies set through setContent/setText/setForm get a replay function so
     * retries can resend identical bytes; setBody with an arbitrary stream
     * does not, and the retrier captures such a body into memory first.
     */
    class Request
    {
    public:
        static Expected<Request> create(std::string method, std::string url);

        Request(Request&&) = default;
        Request& operator=(Request&&) = default;

        const std::string& method() const noexcept { return method_; }
        const std::string& url() const noexcept { return url_; }
        const Url& target() const noexcept { return target_; }
        Expected<void> setUrl(std::string url);

        HeaderMap headers;

        // ---- headers ----
        void setHeader(const std::string& name, const std::string& value) { headers.set(name, value); }
        void setHeaders(const std::vector<std::pair<std::string, std::string>>& kv);
        void setContentType(const std::string& contentType) { headers.set("Content-Type", contentType); }
        void setUserAgent(const std::string& userAgent) { headers.set("User-Agent", userAgent); }
        void setBearerToken(const std::string& token) { headers.set("Authorization", "Bearer " + token); }
        void setBasicAuth(const std::string& username, const std::string& password);

        // Replaces existing values of the given keys in the URL query.
        Expected<void> setQuery(const Params& params);

        // ---- body ----
        void setBody(BodyPtr body, std::int64_t contentLength = -1);
        void setContent(std::string content);
        void setText(std::string text);
        void setForm(const Form& form);
        void setFiles(std::unique_ptr<FormData> formData);

        IBodyReader* body() const noexcept { return body_.get(); }
        BodyPtr& bodyPtr() noexcept { return body_; }
        BodyPtr takeBody() { return std::move(body_); }
        const GetBodyFn& getBody() const noexcept { return getBody_; }
        std::int64_t contentLength() const noexcept { return contentLength_; }

        // Re-creates the body through the replay function, if any.
        Expected<void> rewindBody();

        // ---- context ----
        const ContextPtr& context() const noexcept { return ctx_; }
        void setContext(ContextPtr ctx) { ctx_ = ctx ? std::move(ctx) : Context::background(); }

        // ---- pipeline options ----
        void enableRetry(const std::vector<RetryOption>& opts = {});
        const std::shared_ptr<const Retrier>& retrier() const noexcept { return retrier_; }
        void enableClientTrace() { clientTrace_ = true; }
        bool clientTraceEnabled() const noexcept { return clientTrace_; }

    private:
        Request(std::string method, std::string url, Url target);

        std::string method_;
        std::string url_;
        Url target_;

        BodyPtr body_;
        GetBodyFn getBody_;
        std::int64_t contentLength_{0};

        ContextPtr ctx_;
        std::shared_ptr<const Retrier> retrier_;
        bool clientTrace_{false};
    };


    // Request hooks configure a request before it is sent; an error aborts the call.
    using RequestHook = std::function<Expected<void>(Request&)>;

    RequestHook withHeaders(std::vector<std::pair<std::string, std::string>> kv);
    RequestHook withQuery(Params params);
    RequestHook withContentType(std::string contentType);
    RequestHook withUserAgent(std::string userAgent);
    RequestHook withBearerToken(std::string token);
    RequestHook withBasicAuth(std::string username, std::string password);
    RequestHook withContent(std::string content);
    RequestHook withText(std::string text);
    RequestHook withForm(Form form);
    RequestHook withContext(ContextPtr ctx);
    RequestHook enableRetry(std::vector<RetryOption> opts = {});
    RequestHook enableClientTrace();


} // namespace ghttp
