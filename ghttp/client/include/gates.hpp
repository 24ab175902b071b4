#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include "callbacks.hpp"
#include "context.hpp"
#include "expected.hpp"


namespace ghttp {


    /**
     * @brief Token bucket shared by every request of a client.
     *
     * Holds up to `burst` tokens, refilled continuously at `tokensPerSecond`.
     * A bucket created with a non-positive rate never refills.
     */
    class RateLimiter
    {
    public:
        using Clock = std::chrono::steady_clock;

        RateLimiter(double tokensPerSecond, int burst);

        // Blocks until a token is taken or ctx is done; a cancelled wait takes nothing.
        Expected<void> wait(Context& ctx);

        // Takes a token only if one is available right now.
        bool allow();

        double tokens();
        double rate() const noexcept { return rate_; }
        int burst() const noexcept { return burst_; }

    private:
        void refillLocked(Clock::time_point now);

        const double rate_;
        const int burst_;

        std::mutex mu_;
        std::condition_variable cv_;
        double tokens_;
        Clock::time_point last_;
    };


    // Admits requests through a shared RateLimiter.
    class RateGate : public IBeforeRequestCallback
    {
    public:
        explicit RateGate(std::shared_ptr<RateLimiter> limiter) : limiter_(std::move(limiter)) {}
        Expected<void> enter(Request& req) override;
    private:
        std::shared_ptr<RateLimiter> limiter_;
    };


    /**
     * @brief Bounds the number of requests in flight.
     *
     * Every successful enter() must be matched by exactly one exit(); the
     * client does this for gates registered through Client::setMaxConcurrency.
     */
    class ConcurrencyGate : public IBeforeRequestCallback, public IAfterResponseCallback
    {
    public:
        explicit ConcurrencyGate(std::size_t capacity) : capacity_(capacity) {}

        Expected<void> enter(Request& req) override;
        void exit(Response* resp, const Error* err) override;

        Expected<void> acquire(Context& ctx);
        void release();

        std::size_t capacity() const noexcept { return capacity_; }
        std::size_t inUse();

    private:
        const std::size_t capacity_;
        std::mutex mu_;
        std::condition_variable cv_;
        std::size_t inUse_{0};
    };


} // namespace ghttp
