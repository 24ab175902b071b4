#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include "expected.hpp"


namespace ghttp {


    /**
     * @brief Cancellation signal shared by everything working on one request.
     *
     * A context is done once cancel() was called or its deadline passed.
     * Blocking points (admission gates, backoff sleeps, the transport) poll
     * err() or park on waitFor(); code that waits on its own condition
     * variable registers a listener to be woken by cancel().
     */
    class Context
    {
    public:
        using Clock = std::chrono::steady_clock;
        using ListenerId = std::uint64_t;

        static std::shared_ptr<Context> background();
        static std::shared_ptr<Context> withCancel();
        static std::shared_ptr<Context> withDeadline(Clock::time_point deadline);
        static std::shared_ptr<Context> withTimeout(Clock::duration timeout);

        Context() = default;
        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

        void cancel();

        // Empty while the context is live.
        std::optional<Error> err() const;
        bool done() const { return err().has_value(); }

        std::optional<Clock::time_point> deadline() const { return deadline_; }

        // Sleeps for d unless the context finishes first; returns the context error in that case.
        Expected<void> waitFor(Clock::duration d);

        // Listener runs once, on the thread calling cancel(). Listeners are not
        // invoked for deadline expiry; waiters bound their sleeps by deadline().
        ListenerId addListener(std::function<void()> fn);
        // Once this returns the listener will not run and is not running.
        // Must not be called from inside the listener it removes.
        void removeListener(ListenerId id);

    private:
        std::optional<Clock::time_point> deadline_;

        mutable std::mutex mu_;
        std::condition_variable cv_;
        bool cancelled_{false};
        ListenerId nextId_{1};
        std::map<ListenerId, std::function<void()>> listeners_;
        ListenerId firing_{0};      // listener cancel() is running right now
    };

    using ContextPtr = std::shared_ptr<Context>;

    Error canceledError();
    Error deadlineExceededError();


} // namespace ghttp
