#pragma once
#include <functional>
#include <vector>
#include "backoff.hpp"
#include "context.hpp"
#include "expected.hpp"
#include "request.hpp"


namespace ghttp {

    class Response;

    inline constexpr int kDefaultRetryMaxAttempts = 3;

    // Reports whether an attempt's outcome calls for another one. resp may be null.
    using RetryTrigger = std::function<bool(const Response* resp, const Error* err)>;


    /**
     * @brief Per-request retry policy.
     *
     * maxAttempts counts retries, not sends: with the default of 3 a request is
     * sent at most 4 times. 0 disables retrying.
     */
    class Retrier
    {
    public:
        Retrier();

        int maxAttempts{kDefaultRetryMaxAttempts};
        BackoffPtr backoff;
        std::vector<RetryTrigger> triggers;

        // Captures a body that cannot be replayed so every attempt sends the same bytes.
        Expected<void> prepare(Request& req) const;

        bool shouldRetry(const Context& ctx, int attemptNum, const Response* resp, const Error* err) const;
    };


    RetryOption withRetryMaxAttempts(int n);
    RetryOption withRetryBackoff(BackoffPtr backoff);
    RetryOption withRetryTriggers(std::vector<RetryTrigger> triggers);

    // Retries on any error and on 429 or 5xx responses.
    RetryTrigger retryOnServerErrors();


} // namespace ghttp
