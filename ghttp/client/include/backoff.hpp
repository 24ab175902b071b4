#pragma once
#include <chrono>
#include <memory>


namespace ghttp {

    class Response;
    struct Error;


    /**
     * @brief Computes how long to wait before the next attempt.
     *
     * Called after a failed attempt; attemptNum is 0 for the first retry.
     * Implementations are stateless apart from the jitter random source.
     */
    struct IBackoff
    {
        virtual ~IBackoff() = default;
        virtual std::chrono::nanoseconds wait(int attemptNum, const Response* resp, const Error* err) const = 0;
    };

    using BackoffPtr = std::shared_ptr<const IBackoff>;


    class ConstantBackoff : public IBackoff
    {
    public:
        ConstantBackoff(std::chrono::nanoseconds interval, bool jitter)
        : interval_(interval), jitter_(jitter) {}

        std::chrono::nanoseconds wait(int attemptNum, const Response* resp, const Error* err) const override;

    private:
        std::chrono::nanoseconds interval_;
        bool jitter_;
    };


    // See: https://aws.amazon.com/blogs/architecture/exponential-backoff-and-jitter/
    class ExponentialBackoff : public IBackoff
    {
    public:
        ExponentialBackoff(std::chrono::nanoseconds baseInterval, std::chrono::nanoseconds maxInterval, bool jitter)
        : base_(baseInterval), max_(maxInterval), jitter_(jitter) {}

        std::chrono::nanoseconds wait(int attemptNum, const Response* resp, const Error* err) const override;

    private:
        std::chrono::nanoseconds base_;
        std::chrono::nanoseconds max_;
        bool jitter_;
    };


    // maxValue <= 0 means the sequence is unbounded.
    class FibonacciBackoff : public IBackoff
    {
    public:
        FibonacciBackoff(long long maxValue, std::chrono::nanoseconds interval)
        : maxValue_(maxValue), interval_(interval) {}

        std::chrono::nanoseconds wait(int attemptNum, const Response* resp, const Error* err) const override;

    private:
        long long maxValue_;
        std::chrono::nanoseconds interval_;
    };


    BackoffPtr makeConstantBackoff(std::chrono::nanoseconds interval, bool jitter);
    BackoffPtr makeExponentialBackoff(std::chrono::nanoseconds baseInterval, std::chrono::nanoseconds maxInterval, bool jitter);
    BackoffPtr makeFibonacciBackoff(long long maxValue, std::chrono::nanoseconds interval);


} // namespace ghttp
