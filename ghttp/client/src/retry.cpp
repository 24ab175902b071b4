#include <chrono>
#include "../include/retry.hpp"
#include "../include/response.hpp"


namespace ghttp {

    using namespace std::chrono_literals;


    Retrier::Retrier() : backoff(makeExponentialBackoff(1s, 30s, true)) {}


    Expected<void> Retrier::prepare(Request& req) const {
        if (maxAttempts <= 0 || !req.body() || req.getBody()) return Expected<void>::success();

        auto captured = drainToString(*req.body());
        if (!captured.has_value()) {
            return Expected<void>::failure(ErrorKind::preparation, "capture request body: " + captured.error->message);
        }
        req.setContent(std::move(captured.get()));
        return Expected<void>::success();
    }


    bool Retrier::shouldRetry(const Context& ctx, int attemptNum, const Response* resp, const Error* err) const {
        if (ctx.done() || attemptNum >= maxAttempts) return false;
        if (err && err->isCancellation()) return false;

        if (triggers.empty()) {
            return err != nullptr || (resp && resp->statusCode == kStatusTooManyRequests);
        }
        for (auto const& trigger : triggers) {
            if (trigger && trigger(resp, err)) return true;
        }
        return false;
    }


    RetryOption withRetryMaxAttempts(int n) {
        return [n](Retrier& r) { r.maxAttempts = n; };
    }

    RetryOption withRetryBackoff(BackoffPtr backoff) {
        return [b = std::move(backoff)](Retrier& r) { if (b) r.backoff = b; };
    }

    RetryOption withRetryTriggers(std::vector<RetryTrigger> triggers) {
        return [t = std::move(triggers)](Retrier& r) { r.triggers = t; };
    }


    RetryTrigger retryOnServerErrors() {
        return [](const Response* resp, const Error* err) {
            if (err) return true;
            return resp && (resp->statusCode == kStatusTooManyRequests || resp->statusCode >= 500);
        };
    }


} // namespace ghttp
