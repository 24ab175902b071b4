#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>


namespace ghttp {


    enum class ConnEvent : std::size_t {
        getConn = 0,
        gotConn,
        dnsStart,
        dnsDone,
        connectStart,
        connectDone,
        tlsHandshakeStart,
        tlsHandshakeDone,
        gotFirstResponseByte,
        wroteRequest,
        count_
    };

    struct ConnInfo
    {
        bool reused{false};
        bool wasIdle{false};
        std::chrono::nanoseconds idleTime{0};
    };


    // Connection-lifecycle callbacks a transport fires during one round trip.
    struct ITraceHooks
    {
        virtual ~ITraceHooks() = default;
        virtual void record(ConnEvent ev, std::chrono::steady_clock::time_point at) = 0;
        virtual void gotConnInfo(const ConnInfo& info) = 0;
    };


    struct TraceInfo
    {
        std::chrono::nanoseconds dnsLookupTime{0};     // DNS lookup
        std::chrono::nanoseconds tcpConnTime{0};       // TCP connect
        std::chrono::nanoseconds tlsHandshakeTime{0};  // TLS handshake
        std::chrono::nanoseconds connTime{0};          // obtaining a usable connection
        std::chrono::nanoseconds serverTime{0};        // request written -> first response byte
        std::chrono::nanoseconds responseTime{0};      // first response byte -> completion
        std::chrono::nanoseconds totalTime{0};         // end to end
        bool connReused{false};
        bool connWasIdle{false};
        std::chrono::nanoseconds connIdleTime{0};

        std::string toString() const;
    };


    /**
     * @brief Timestamps of one attempt, keyed by lifecycle event.
     *
     * Events that never fire stay at the zero time point; any pair with a
     * missing side yields a zero duration in the snapshot, never a negative one.
     */
    class ClientTrace : public ITraceHooks
    {
    public:
        using Clock = std::chrono::steady_clock;

        ClientTrace() : start_(Clock::now()) {}

        void record(ConnEvent ev, Clock::time_point at) override;
        void gotConnInfo(const ConnInfo& info) override;

        void done() { std::scoped_lock lk(mu_); end_ = Clock::now(); }

        TraceInfo info() const;

    private:
        mutable std::mutex mu_;
        Clock::time_point start_;
        Clock::time_point end_{};
        std::array<Clock::time_point, static_cast<std::size_t>(ConnEvent::count_)> at_{};
        ConnInfo conn_{};
    };


} // namespace ghttp
