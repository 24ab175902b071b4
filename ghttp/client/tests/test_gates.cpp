#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "../include/gates.hpp"

using namespace ghttp;
using namespace std::chrono_literals;


// No assertions here: also called from worker threads.
static Request makeRequest(ContextPtr ctx = nullptr) {
    auto req = Request::create(method::get, "http://example.com/");
    req.get().setContext(std::move(ctx));
    return std::move(req.get());
}


// ---------- rate limiter ----------------------------------------------------

TEST_CASE("rate limiter hands out the burst without waiting") {
    RateLimiter lim(1.0, 3);
    REQUIRE(lim.allow());
    REQUIRE(lim.allow());
    REQUIRE(lim.allow());
    REQUIRE_FALSE(lim.allow());
}

TEST_CASE("rate limiter refills over time") {
    RateLimiter lim(100.0, 1);
    REQUIRE(lim.allow());
    REQUIRE_FALSE(lim.allow());

    auto ctx = Context::background();
    auto start = std::chrono::steady_clock::now();
    REQUIRE(lim.wait(*ctx).has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("rate gate fails fast when the next token is past the deadline") {
    auto lim = std::make_shared<RateLimiter>(0.1, 1);   // one token per 10s
    REQUIRE(lim->allow());

    RateGate gate(lim);
    auto req = makeRequest(Context::withTimeout(100ms));

    auto start = std::chrono::steady_clock::now();
    auto r = gate.enter(req);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error->kind == ErrorKind::deadlineExceeded);
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);
}

TEST_CASE("cancelled rate wait does not consume a token") {
    auto lim = std::make_shared<RateLimiter>(1.0, 1);
    REQUIRE(lim->allow());

    auto ctx = Context::withCancel();
    std::thread canceller([ctx]{
        std::this_thread::sleep_for(20ms);
        ctx->cancel();
    });
    auto r = lim->wait(*ctx);
    canceller.join();

    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error->kind == ErrorKind::canceled);
    // the bucket kept refilling; nothing was taken by the cancelled waiter
    REQUIRE(lim->tokens() > 0.0);
    REQUIRE(lim->tokens() < 1.0);
}

TEST_CASE("already cancelled context never takes a token") {
    RateLimiter lim(1.0, 1);
    auto ctx = Context::withCancel();
    ctx->cancel();
    REQUIRE_FALSE(lim.wait(*ctx).has_value());
    REQUIRE(lim.allow());
}


// ---------- concurrency gate ------------------------------------------------

TEST_CASE("concurrency gate admits up to capacity") {
    ConcurrencyGate gate(2);
    auto a = makeRequest();
    auto b = makeRequest();
    REQUIRE(gate.enter(a).has_value());
    REQUIRE(gate.enter(b).has_value());
    REQUIRE(gate.inUse() == 2);

    gate.exit(nullptr, nullptr);
    REQUIRE(gate.inUse() == 1);
    gate.exit(nullptr, nullptr);
    REQUIRE(gate.inUse() == 0);
}

TEST_CASE("concurrency gate blocks until a slot is handed over") {
    ConcurrencyGate gate(1);
    auto first = makeRequest();
    REQUIRE(gate.enter(first).has_value());

    std::atomic<bool> entered{false};
    std::thread waiter([&]{
        auto second = makeRequest();
        auto r = gate.enter(second);
        entered = r.has_value();
    });

    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(entered.load());

    gate.exit(nullptr, nullptr);
    waiter.join();
    REQUIRE(entered.load());
    REQUIRE(gate.inUse() == 1);
}

TEST_CASE("concurrency gate wait ends with the context error") {
    ConcurrencyGate gate(1);
    auto first = makeRequest();
    REQUIRE(gate.enter(first).has_value());

    auto ctx = Context::withCancel();
    auto second = makeRequest(ctx);
    std::thread canceller([ctx]{
        std::this_thread::sleep_for(20ms);
        ctx->cancel();
    });
    auto r = gate.enter(second);
    canceller.join();

    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error->kind == ErrorKind::canceled);
    REQUIRE(gate.inUse() == 1);
}

TEST_CASE("concurrency gate bounds in-flight work across threads") {
    constexpr std::size_t kCap = 3;
    ConcurrencyGate gate(kCap);
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 12; ++i) {
        workers.emplace_back([&]{
            auto req = makeRequest();
            if (!gate.enter(req).has_value()) return;
            int now = ++inFlight;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(10ms);
            --inFlight;
            gate.exit(nullptr, nullptr);
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(peak.load() <= static_cast<int>(kCap));
    REQUIRE(gate.inUse() == 0);
}
