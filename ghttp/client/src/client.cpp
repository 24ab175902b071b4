#include <algorithm>
#include <chrono>
#include <stdexcept>
#include "../include/client.hpp"
#include "../include/debug.hpp"
#include "../include/gzip_body.hpp"
#include "../include/retry.hpp"


namespace ghttp {

    using logger::LogLevel;
    using logger::LogRecord;


    Client::Client(ClientConfig config, std::shared_ptr<ITransport> transport)
        : transport_(transport ? std::move(transport) : makeCurlTransport(config.transport)),
          logger_(std::move(config.logger))
    {
        if (config.rateLimit) enableRateLimiting(std::make_shared<RateLimiter>(*config.rateLimit, config.rateBurst));
        if (config.maxConcurrency) setMaxConcurrency(*config.maxConcurrency);
        if (config.debugStream) enableDebugging(*config.debugStream, config.debugBody);
    }


    void Client::registerBeforeRequestCallbacks(const std::vector<std::shared_ptr<IBeforeRequestCallback>>& callbacks) {
        for (auto const& cb : callbacks) {
            if (cb) before_.push_back(cb);
        }
    }


    void Client::registerAfterResponseCallbacks(const std::vector<std::shared_ptr<IAfterResponseCallback>>& callbacks) {
        for (auto const& cb : callbacks) {
            if (cb) after_.push_back(cb);
        }
    }


    void Client::enableRateLimiting(std::shared_ptr<RateLimiter> limiter) {
        registerBeforeRequestCallbacks({std::make_shared<RateGate>(std::move(limiter))});
    }


    void Client::setMaxConcurrency(std::size_t n) {
        auto gate = std::make_shared<ConcurrencyGate>(n);
        registerBeforeRequestCallbacks({gate});
        registerAfterResponseCallbacks({gate});
    }


    void Client::enableDebugging(std::ostream& out, bool body) {
        auto dbg = std::make_shared<Debugger>(out, body);
        registerBeforeRequestCallbacks({dbg});
        registerAfterResponseCallbacks({dbg});
    }


    Expected<void> Client::onBeforeRequest(Request& req) {
        for (std::size_t i = 0; i < before_.size(); ++i) {
            auto res = before_[i]->enter(req);
            if (res.has_value()) continue;

            // Give back what the entered callbacks hold (concurrency slots), newest first.
            for (std::size_t j = i; j-- > 0; ) {
                auto* paired = dynamic_cast<IAfterResponseCallback*>(before_[j].get());
                if (!paired) continue;
                bool registered = std::any_of(after_.begin(), after_.end(),
                                              [paired](const auto& a){ return a.get() == paired; });
                if (registered) paired->exit(nullptr, &*res.error);
            }
            return res;
        }
        return Expected<void>::success();
    }


    void Client::onAfterResponse(Response* resp, const Error* err) {
        for (auto const& cb : after_) {
            cb->exit(resp, err);
        }
    }


    Expected<Response> Client::roundTrip(Request& req, const std::shared_ptr<ClientTrace>& trace) {
        auto res = transport_->roundTrip(req, trace.get());
        if (trace) trace->done();
        if (!res.has_value()) return res;

        Response& resp = res.get();
        resp.clientTrace = trace;

        auto encoding = resp.headers.get("Content-Encoding");
        if (encoding && equalsIgnoreCase(*encoding, "gzip") && !bodyEmpty(resp.body)
            && !dynamic_cast<GzipBody*>(resp.body.get()))
        {
            auto gz = GzipBody::create(std::move(resp.body));
            if (!gz.has_value()) return Expected<Response>::failure(*gz.error);
            resp.body = std::move(gz.get());
        }
        return res;
    }


    Expected<Response> Client::doWithRetry(Request& req) {
        auto& ctx = *req.context();
        const auto& retrier = req.retrier();

        for (int attemptNum = 0; ; ++attemptNum) {
            std::shared_ptr<ClientTrace> trace = req.clientTraceEnabled() ? std::make_shared<ClientTrace>() : nullptr;

            if (logger_ && logger_->enabled(LogLevel::debug)) {
                LogRecord rec;
                rec.level = LogLevel::debug;
                rec.logger = "client";
                rec.msg = "sending request";
                rec.method = req.method();
                rec.url = req.url();
                rec.attempt = attemptNum;
                logger_->log(std::move(rec));
            }

            auto res = roundTrip(req, trace);
            const Response* resp = res.has_value() ? &res.get() : nullptr;
            const Error* err = res.error ? &*res.error : nullptr;

            if (!retrier || !retrier->shouldRetry(ctx, attemptNum, resp, err)) {
                transport_->closeIdleConnections();
                return res;
            }

            auto sleep = retrier->backoff ? retrier->backoff->wait(attemptNum, resp, err) : std::chrono::nanoseconds{0};

            if (logger_ && logger_->enabled(LogLevel::warn)) {
                LogRecord rec;
                rec.level = LogLevel::warn;
                rec.logger = "client";
                rec.msg = err ? "retrying after error: " + err->message : "retrying after status " + resp->status;
                rec.method = req.method();
                rec.url = req.url();
                rec.attempt = attemptNum;
                rec.waitMs = std::chrono::duration_cast<std::chrono::milliseconds>(sleep).count();
                if (resp) rec.httpStatus = resp->statusCode;
                logger_->log(std::move(rec));
            }

            // Discard the previous response so its resources are released before the next attempt.
            if (res.has_value() && res.get().body) {
                auto drained = copyBody(*res.get().body, [](const char*, std::size_t){ return Expected<void>::success(); });
                if (!drained.has_value()) {
                    GHTTP_LOG(logger_, LogLevel::debug, "client") << "discard response body: " << drained.error->message;
                }
                res.get().close();
            }

            auto rewound = req.rewindBody();
            if (!rewound.has_value()) {
                transport_->closeIdleConnections();
                return Expected<Response>::failure(*rewound.error);
            }

            auto slept = ctx.waitFor(sleep);
            if (!slept.has_value()) {
                transport_->closeIdleConnections();
                return Expected<Response>::failure(*slept.error);
            }
        }
    }


    Expected<Response> Client::execute(Request& req) {
        auto entered = onBeforeRequest(req);
        if (!entered.has_value()) {
            GHTTP_LOG(logger_, LogLevel::error, "client") << req.method() << " " << req.url() << ": " << entered.error->message;
            return Expected<Response>::failure(*entered.error);
        }

        if (auto const& retrier = req.retrier()) {
            auto prepared = retrier->prepare(req);
            if (!prepared.has_value()) {
                GHTTP_LOG(logger_, LogLevel::error, "client") << req.method() << " " << req.url() << ": " << prepared.error->message;
                onAfterResponse(nullptr, &*prepared.error);
                return Expected<Response>::failure(*prepared.error);
            }
        }

        auto res = doWithRetry(req);
        if (!res.has_value()) {
            GHTTP_LOG(logger_, LogLevel::error, "client") << req.method() << " " << req.url() << ": " << res.error->message;
            onAfterResponse(nullptr, &*res.error);
        } else {
            onAfterResponse(&res.get(), nullptr);
        }
        return res;
    }


    Response Client::mustExecute(Request& req) {
        auto res = execute(req);
        if (!res.has_value()) throw std::runtime_error(res.error->message);
        return std::move(res.get());
    }


    Expected<Response> Client::send(const std::string& method, const std::string& url, const std::vector<RequestHook>& hooks) {
        auto req = Request::create(method, url);
        if (!req.has_value()) return Expected<Response>::failure(*req.error);

        for (auto const& hook : hooks) {
            if (!hook) continue;
            auto res = hook(req.get());
            if (!res.has_value()) return Expected<Response>::failure(*res.error);
        }
        return execute(req.get());
    }


} // namespace ghttp
