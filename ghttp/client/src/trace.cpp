#include <iomanip>
#include <sstream>
#include "../include/trace.hpp"


namespace ghttp {

    using Clock = std::chrono::steady_clock;

    static std::chrono::nanoseconds span(Clock::time_point from, Clock::time_point to) {
        const Clock::time_point zero{};
        if (from == zero || to == zero || to < from) return std::chrono::nanoseconds{0};
        return std::chrono::duration_cast<std::chrono::nanoseconds>(to - from);
    }

    static std::string ms(std::chrono::nanoseconds d) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << (static_cast<double>(d.count()) / 1e6) << "ms";
        return oss.str();
    }


    void ClientTrace::record(ConnEvent ev, Clock::time_point at) {
        auto idx = static_cast<std::size_t>(ev);
        if (idx >= at_.size()) return;
        std::scoped_lock lk(mu_);
        at_[idx] = at;
    }

    void ClientTrace::gotConnInfo(const ConnInfo& info) {
        std::scoped_lock lk(mu_);
        conn_ = info;
    }


    TraceInfo ClientTrace::info() const {
        std::scoped_lock lk(mu_);
        auto t = [this](ConnEvent ev){ return at_[static_cast<std::size_t>(ev)]; };

        TraceInfo ti;
        ti.dnsLookupTime    = span(t(ConnEvent::dnsStart), t(ConnEvent::dnsDone));
        ti.tcpConnTime      = span(t(ConnEvent::connectStart), t(ConnEvent::connectDone));
        ti.tlsHandshakeTime = span(t(ConnEvent::tlsHandshakeStart), t(ConnEvent::tlsHandshakeDone));
        ti.connTime         = span(t(ConnEvent::getConn), t(ConnEvent::gotConn));
        ti.serverTime       = span(t(ConnEvent::wroteRequest), t(ConnEvent::gotFirstResponseByte));
        ti.responseTime     = span(t(ConnEvent::gotFirstResponseByte), end_);
        ti.totalTime        = span(start_, end_);
        ti.connReused       = conn_.reused;
        ti.connWasIdle      = conn_.wasIdle;
        ti.connIdleTime     = conn_.idleTime;
        return ti;
    }


    std::string TraceInfo::toString() const {
        std::ostringstream out;
        out << "DNS lookup:     " << ms(dnsLookupTime) << '\n'
            << "TCP connect:    " << ms(tcpConnTime) << '\n'
            << "TLS handshake:  " << ms(tlsHandshakeTime) << '\n'
            << "Get connection: " << ms(connTime) << '\n'
            << "Server:         " << ms(serverTime) << '\n'
            << "Response:       " << ms(responseTime) << '\n'
            << "Total:          " << ms(totalTime) << '\n'
            << "Conn reused:    " << (connReused ? "yes" : "no") << '\n'
            << "Conn was idle:  " << (connWasIdle ? "yes" : "no");
        if (connWasIdle) out << " (" << ms(connIdleTime) << ")";
        out << '\n';
        return out.str();
    }


} // namespace ghttp
