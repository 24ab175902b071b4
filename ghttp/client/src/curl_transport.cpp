#include <curl/curl.h>
#include <algorithm>
#include <cstdint>
#include <mutex>
#include <string>
#include <memory>
#include <vector>
#include "../include/transport.hpp"


namespace ghttp {

    namespace {

        using Clock = std::chrono::steady_clock;

        constexpr std::size_t kMaxIdleHandles = 16;


        struct Transfer
        {
            Request& req;
            ITraceHooks* hooks{nullptr};

            std::optional<Error> readErr;
            std::int64_t sent{0};
            bool wroteStamped{false};
            bool firstByteStamped{false};

            std::string proto;
            std::string reason;
            HeaderMap headers;
            std::string body;
        };


        std::string_view trimSpace(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.remove_suffix(1);
            return s;
        }


        const char* statusText(long code) {
            switch (code) {
                case 100: return "Continue";
                case 200: return "OK";
                case 201: return "Created";
                case 202: return "Accepted";
                case 204: return "No Content";
                case 206: return "Partial Content";
                case 301: return "Moved Permanently";
                case 302: return "Found";
                case 303: return "See Other";
                case 304: return "Not Modified";
                case 307: return "Temporary Redirect";
                case 308: return "Permanent Redirect";
                case 400: return "Bad Request";
                case 401: return "Unauthorized";
                case 403: return "Forbidden";
                case 404: return "Not Found";
                case 405: return "Method Not Allowed";
                case 408: return "Request Timeout";
                case 409: return "Conflict";
                case 413: return "Request Entity Too Large";
                case 429: return "Too Many Requests";
                case 500: return "Internal Server Error";
                case 501: return "Not Implemented";
                case 502: return "Bad Gateway";
                case 503: return "Service Unavailable";
                case 504: return "Gateway Timeout";
                default:  return "";
            }
        }


        // libcurl read callback: streams the request body
        size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
            auto* t = static_cast<Transfer*>(userp);
            IBodyReader* body = t->req.body();
            if (!body) return 0;

            auto r = body->read(buffer, size * nitems);
            if (!r.has_value()) {
                t->readErr = *r.error;
                return CURL_READFUNC_ABORT;
            }
            t->sent += static_cast<std::int64_t>(r.get());
            // libcurl stops asking once INFILESIZE bytes went out, so a known length ends the upload too.
            const std::int64_t want = t->req.contentLength();
            bool complete = r.get() == 0 || (want > 0 && t->sent >= want);
            if (complete && !t->wroteStamped) {
                t->wroteStamped = true;
                if (t->hooks) t->hooks->record(ConnEvent::wroteRequest, Clock::now());
            }
            return r.get();
        }


        // libcurl header callback: one call per header line, status lines included
        size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
            auto* t = static_cast<Transfer*>(userp);
            size_t realSize = size * nitems;

            if (!t->firstByteStamped) {
                t->firstByteStamped = true;
                if (t->hooks) t->hooks->record(ConnEvent::gotFirstResponseByte, Clock::now());
            }

            std::string_view line(buffer, realSize);
            line = trimSpace(line);
            if (line.empty()) return realSize;

            if (line.rfind("HTTP/", 0) == 0) {
                // Interim (1xx) or redirect response: keep only the last one.
                t->headers.clear();
                auto sp = line.find(' ');
                t->proto.assign(line.substr(0, sp));
                t->reason.clear();
                if (sp != std::string_view::npos) {
                    auto rest = line.substr(sp + 1);
                    auto sp2 = rest.find(' ');
                    if (sp2 != std::string_view::npos) t->reason.assign(trimSpace(rest.substr(sp2 + 1)));
                }
                return realSize;
            }

            auto colon = line.find(':');
            if (colon != std::string_view::npos) {
                t->headers.append(std::string(trimSpace(line.substr(0, colon))),
                                  std::string(trimSpace(line.substr(colon + 1))));
            }
            return realSize;
        }


        size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            size_t realSize = size * nmemb;
            auto* t = static_cast<Transfer*>(userp);
            t->body.append(static_cast<char*>(contents), realSize);
            return realSize;
        }


        // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
        int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
            auto* t = static_cast<Transfer*>(userp);
            return t->req.context()->done() ? 1 : 0;
        }


        Clock::time_point offset(Clock::time_point t0, curl_off_t micros) {
            return t0 + std::chrono::microseconds(micros);
        }

    } // anonymous namespace


    class CurlTransport : public ITransport
    {
    public:
        explicit CurlTransport(TransportConfig config) : config_(std::move(config)) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~CurlTransport() override {
            closeIdleConnections();
            curl_global_cleanup();
        }

        Expected<Response> roundTrip(Request& req, ITraceHooks* hooks) override;

        void closeIdleConnections() override {
            std::vector<Idle> drop;
            {
                std::scoped_lock lk(mu_);
                drop.swap(idle_);
            }
            for (auto& h : drop) curl_easy_cleanup(h.curl);
        }

    private:
        struct Idle
        {
            CURL* curl{nullptr};
            Clock::time_point since{};
        };

        Idle acquire() {
            {
                std::scoped_lock lk(mu_);
                if (!idle_.empty()) {
                    Idle h = idle_.back();
                    idle_.pop_back();
                    return h;
                }
            }
            return Idle{curl_easy_init(), {}};
        }

        void release(CURL* curl) {
            curl_easy_reset(curl);
            {
                std::scoped_lock lk(mu_);
                if (idle_.size() < kMaxIdleHandles) {
                    idle_.push_back(Idle{curl, Clock::now()});
                    return;
                }
            }
            curl_easy_cleanup(curl);
        }

        void reportTrace(CURL* curl, ITraceHooks* hooks, const Transfer& t, Clock::time_point t0, const Idle& handle);

        TransportConfig config_;
        std::mutex mu_;
        std::vector<Idle> idle_;
    };


    void CurlTransport::reportTrace(CURL* curl, ITraceHooks* hooks, const Transfer& t, Clock::time_point t0, const Idle& handle) {
        curl_off_t dns = 0, connect = 0, appconnect = 0, pretransfer = 0, starttransfer = 0;
        long connects = 0;
        curl_easy_getinfo(curl, CURLINFO_NAMELOOKUP_TIME_T, &dns);
        curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME_T, &connect);
        curl_easy_getinfo(curl, CURLINFO_APPCONNECT_TIME_T, &appconnect);
        curl_easy_getinfo(curl, CURLINFO_PRETRANSFER_TIME_T, &pretransfer);
        curl_easy_getinfo(curl, CURLINFO_STARTTRANSFER_TIME_T, &starttransfer);
        curl_easy_getinfo(curl, CURLINFO_NUM_CONNECTS, &connects);

        const bool reused = connects == 0 && handle.since != Clock::time_point{};
        if (!reused) {
            if (dns > 0) {
                hooks->record(ConnEvent::dnsStart, t0);
                hooks->record(ConnEvent::dnsDone, offset(t0, dns));
            }
            if (connect > 0) {
                hooks->record(ConnEvent::connectStart, offset(t0, dns));
                hooks->record(ConnEvent::connectDone, offset(t0, connect));
            }
            if (appconnect > 0) {
                hooks->record(ConnEvent::tlsHandshakeStart, offset(t0, connect));
                hooks->record(ConnEvent::tlsHandshakeDone, offset(t0, appconnect));
            }
        }
        hooks->record(ConnEvent::gotConn, offset(t0, std::max({dns, connect, appconnect})));

        ConnInfo info;
        info.reused = reused;
        info.wasIdle = reused;
        if (reused) info.idleTime = std::chrono::duration_cast<std::chrono::nanoseconds>(t0 - handle.since);
        hooks->gotConnInfo(info);

        if (!t.wroteStamped && pretransfer > 0) hooks->record(ConnEvent::wroteRequest, offset(t0, pretransfer));
        if (!t.firstByteStamped && starttransfer > 0) hooks->record(ConnEvent::gotFirstResponseByte, offset(t0, starttransfer));
    }


    Expected<Response> CurlTransport::roundTrip(Request& req, ITraceHooks* hooks) {
        auto& ctx = *req.context();
        if (auto e = ctx.err()) return Expected<Response>::failure(*e);

        Idle handle = acquire();
        CURL* curl = handle.curl;
        if (!curl) {
            return Expected<Response>::failure("curl init failed");
        }

        Transfer t{req, hooks};
        char errorBuffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl, CURLOPT_URL, req.url().c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &t);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &t);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &t);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        // ---- method and body ----
        const std::string& verb = req.method();
        if (req.body()) {
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &t);
            if (req.contentLength() >= 0) {
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(req.contentLength()));
            }
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb.c_str());
        } else if (verb == method::head) {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else if (verb == method::post) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
        } else if (verb != method::get) {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb.c_str());
        }

        // ---- headers ----
        struct curl_slist* headerList = nullptr;
        for (auto const& [k, v] : req.headers) {
            headerList = curl_slist_append(headerList, (k + ": " + v).c_str());
        }
        // No 100-continue round trip
        headerList = curl_slist_append(headerList, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
        if (!req.headers.has("User-Agent")) curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());

        // ---- timeouts, redirects, TLS, proxy ----
        auto totalMs = config_.totalTimeout.count();
        if (auto dl = ctx.deadline()) {
            // Rounded up so curl never gives up before the deadline has passed.
            auto left = std::chrono::ceil<std::chrono::milliseconds>(*dl - Clock::now()).count();
            if (left < 1) left = 1;
            if (totalMs == 0 || left < totalMs) totalMs = left;
        }
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connectTimeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(totalMs));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config_.followRedirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.maxRedirects);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verifyTls ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verifyTls ? 2L : 0L);
        if (config_.caFile) curl_easy_setopt(curl, CURLOPT_CAINFO, config_.caFile->c_str());
        if (config_.clientCert) curl_easy_setopt(curl, CURLOPT_SSLCERT, config_.clientCert->c_str());
        if (config_.clientKey) curl_easy_setopt(curl, CURLOPT_SSLKEY, config_.clientKey->c_str());
        if (config_.proxy) curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy->c_str());

        const auto t0 = Clock::now();
        if (hooks) hooks->record(ConnEvent::getConn, t0);

        CURLcode res = curl_easy_perform(curl);

        if (hooks) reportTrace(curl, hooks, t, t0, handle);

        long statusCode = 0;
        char* effective = nullptr;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
        std::string effectiveUrl = effective ? effective : req.url();

        curl_slist_free_all(headerList);
        release(curl);
        if (req.body()) req.body()->close();

        if (res != CURLE_OK) {
            if (auto e = ctx.err()) return Expected<Response>::failure(*e);
            if (t.readErr) return Expected<Response>::failure(*t.readErr);
            return Expected<Response>::failure(
                std::string("curl error: ") +
                (errorBuffer[0] ? errorBuffer : curl_easy_strerror(res))
            );
        }

        Response resp;
        resp.statusCode = static_cast<int>(statusCode);
        if (req.target().scheme == "file" && resp.statusCode == 0) resp.statusCode = kStatusOK;
        std::string reason = t.reason.empty() ? statusText(resp.statusCode) : t.reason;
        resp.status = std::to_string(resp.statusCode) + (reason.empty() ? "" : " " + reason);
        if (!t.proto.empty()) resp.proto = t.proto;
        resp.headers = std::move(t.headers);
        resp.effectiveUrl = std::move(effectiveUrl);
        resp.body = std::make_unique<StringBody>(std::move(t.body));
        return Expected<Response>::success(std::move(resp));
    }


    // Factory helper: link this TU and call for production
    std::shared_ptr<ITransport> makeCurlTransport(TransportConfig config) {
        return std::make_shared<CurlTransport>(std::move(config));
    }

} // namespace ghttp
