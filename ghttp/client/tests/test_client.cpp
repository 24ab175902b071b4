#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <zlib.h>

#include "../include/client.hpp"
#include "../include/retry.hpp"

using namespace ghttp;
using namespace std::chrono_literals;


// ---------- Fake transport ----------------------------------------------------

using Step = std::function<Expected<Response>(Request&, ITraceHooks*)>;

static Response respond(int code, std::string body = {}, HeaderMap headers = {}) {
    Response r;
    r.statusCode = code;
    r.status = std::to_string(code);
    r.headers = std::move(headers);
    r.body = std::make_unique<StringBody>(std::move(body));
    return r;
}

static Step reply(int code, std::string body = {}, HeaderMap headers = {}) {
    return [=](Request&, ITraceHooks*) { return Expected<Response>::success(respond(code, body, headers)); };
}

static Step fail(std::string msg) {
    return [=](Request&, ITraceHooks*) { return Expected<Response>::failure(ErrorKind::transport, msg); };
}

// Plays the scripted steps in order and repeats the last one.
struct ScriptedTransport : ITransport {
    std::vector<Step> script;

    std::mutex mu;
    int calls{0};
    int closeIdleCalls{0};
    std::vector<std::string> methods;
    std::vector<std::string> urls;
    std::vector<std::string> bodies;

    Expected<Response> roundTrip(Request& req, ITraceHooks* hooks) override {
        Step step;
        {
            std::scoped_lock lk(mu);
            step = script.empty() ? reply(200) : script[std::min<std::size_t>(calls, script.size() - 1)];
            ++calls;
            methods.push_back(req.method());
            urls.push_back(req.url());
        }

        std::string sent;
        if (req.body()) {
            auto b = drainToString(*req.body());
            if (!b.has_value()) return Expected<Response>::failure(*b.error);
            sent = b.get();
        }
        {
            std::scoped_lock lk(mu);
            bodies.push_back(sent);
        }
        return step(req, hooks);
    }

    void closeIdleConnections() override {
        std::scoped_lock lk(mu);
        ++closeIdleCalls;
    }
};

struct CountingBackoff : IBackoff {
    mutable std::atomic<int> calls{0};
    std::chrono::nanoseconds interval;
    explicit CountingBackoff(std::chrono::nanoseconds d) : interval(d) {}
    std::chrono::nanoseconds wait(int, const Response*, const Error*) const override {
        ++calls;
        return interval;
    }
};

struct Recorder : IBeforeRequestCallback, IAfterResponseCallback {
    Recorder(std::vector<std::string>& log, std::string name) : log(log), name(std::move(name)) {}

    Expected<void> enter(Request&) override {
        log.push_back(name + ":enter");
        return Expected<void>::success();
    }
    void exit(Response* resp, const Error* err) override {
        log.push_back(name + ":exit:" + (err ? "err" : resp ? std::to_string(resp->statusCode) : "none"));
    }

    std::vector<std::string>& log;
    std::string name;
};

struct BrokenBody : IBodyReader {
    Expected<std::size_t> read(char*, std::size_t) override {
        return Expected<std::size_t>::failure(ErrorKind::stream, "broken body");
    }
};

class CaptureSink : public logger::ILoggerSink
{
public:
    void write(const logger::LogRecord& rec) override {
        std::scoped_lock lk(mu);
        records.push_back(rec);
    }
    std::mutex mu;
    std::vector<logger::LogRecord> records;
};

static std::string gzipCompress(const std::string& in) {
    z_stream zs{};
    REQUIRE(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    std::string out;
    char buf[4096];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        out.append(buf, sizeof(buf) - zs.avail_out);
    } while (ret == Z_OK);
    deflateEnd(&zs);
    REQUIRE(ret == Z_STREAM_END);
    return out;
}

static HeaderMap gzipHeaders() {
    HeaderMap h;
    h.set("Content-Encoding", "GZIP");
    return h;
}

static Request makeRequest(const std::string& m = method::get, const std::string& url = "http://example.com/") {
    auto req = Request::create(m, url);
    REQUIRE(req.has_value());
    return std::move(req.get());
}


// ---------- callbacks ------------------------------------------------------------

TEST_CASE("callbacks run in registration order around the round trip") {
    auto transport = std::make_shared<ScriptedTransport>();
    Client client(ClientConfig{}, transport);

    std::vector<std::string> log;
    auto a = std::make_shared<Recorder>(log, "a");
    auto b = std::make_shared<Recorder>(log, "b");
    client.registerBeforeRequestCallbacks({a, b});
    client.registerAfterResponseCallbacks({a, b});

    auto req = makeRequest();
    auto res = client.execute(req);
    REQUIRE(res.has_value());
    REQUIRE(res.get().statusCode == 200);
    REQUIRE(log == std::vector<std::string>{"a:enter", "b:enter", "a:exit:200", "b:exit:200"});
    REQUIRE(transport->calls == 1);
    REQUIRE(transport->closeIdleCalls == 1);
}

TEST_CASE("a failing before-callback aborts the call and releases entered gates") {
    auto transport = std::make_shared<ScriptedTransport>();
    Client client(ClientConfig{}, transport);

    std::vector<std::string> log;
    auto rec = std::make_shared<Recorder>(log, "rec");
    auto gate = std::make_shared<ConcurrencyGate>(1);
    auto reject = std::make_shared<HookCallback>([](Request&) {
        return Expected<void>::failure(ErrorKind::preparation, "rejected by hook");
    });
    client.registerBeforeRequestCallbacks({rec, gate, reject});
    client.registerAfterResponseCallbacks({rec, gate});

    auto req = makeRequest();
    auto res = client.execute(req);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->message == "rejected by hook");
    REQUIRE(transport->calls == 0);
    REQUIRE(gate->inUse() == 0);
    REQUIRE(log == std::vector<std::string>{"rec:enter", "rec:exit:err"});
}

TEST_CASE("after-callbacks see a body capture failure") {
    auto transport = std::make_shared<ScriptedTransport>();
    Client client(ClientConfig{}, transport);
    std::vector<std::string> log;
    auto rec = std::make_shared<Recorder>(log, "rec");
    client.registerAfterResponseCallbacks({rec});

    auto req = makeRequest(method::post);
    req.setBody(std::make_unique<BrokenBody>());
    req.enableRetry();

    auto res = client.execute(req);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->kind == ErrorKind::preparation);
    REQUIRE(transport->calls == 0);
    REQUIRE(log == std::vector<std::string>{"rec:exit:err"});
}


// ---------- retry loop -------------------------------------------------------------

TEST_CASE("429 responses are retried exactly maxAttempts times") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(429, "slow down")};
    Client client(ClientConfig{}, transport);

    auto backoff = std::make_shared<CountingBackoff>(1ms);
    auto req = makeRequest();
    req.enableRetry({withRetryMaxAttempts(3), withRetryBackoff(backoff)});

    auto res = client.execute(req);
    REQUIRE(res.has_value());
    REQUIRE(res.get().statusCode == 429);
    REQUIRE(res.get().content().get() == "slow down");
    REQUIRE(transport->calls == 4);
    REQUIRE(backoff->calls.load() == 3);
    REQUIRE(transport->closeIdleCalls == 1);
}

TEST_CASE("errors are retried and the request body is replayed identically") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {fail("connection reset"), fail("connection reset"), reply(201, "created")};
    Client client(ClientConfig{}, transport);

    auto req = makeRequest(method::post);
    req.setBody(std::make_unique<StringBody>("one-shot payload"));
    req.enableRetry({withRetryBackoff(makeConstantBackoff(1ms, false))});

    auto res = client.execute(req);
    REQUIRE(res.has_value());
    REQUIRE(res.get().statusCode == 201);
    REQUIRE(transport->calls == 3);
    REQUIRE(transport->bodies == std::vector<std::string>(3, "one-shot payload"));
}

TEST_CASE("without retry the first outcome is final") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {fail("no route to host"), reply(200)};
    Client client(ClientConfig{}, transport);

    auto req = makeRequest();
    auto res = client.execute(req);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->kind == ErrorKind::transport);
    REQUIRE(res.error->message == "no route to host");
    REQUIRE(transport->calls == 1);
}

TEST_CASE("a deadline during the backoff sleep ends the call with the deadline error") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {fail("connection refused")};
    Client client(ClientConfig{}, transport);

    auto req = makeRequest();
    req.setContext(Context::withTimeout(50ms));
    req.enableRetry({withRetryBackoff(makeConstantBackoff(10s, false))});

    auto start = std::chrono::steady_clock::now();
    auto res = client.execute(req);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->kind == ErrorKind::deadlineExceeded);
    REQUIRE(res.error->message == "context deadline exceeded");
    REQUIRE(transport->calls == 1);
    REQUIRE(elapsed < 5s);
}

TEST_CASE("cancel during the backoff sleep ends the call with the canceled error") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(429)};
    Client client(ClientConfig{}, transport);

    auto ctx = Context::withCancel();
    auto req = makeRequest();
    req.setContext(ctx);
    req.enableRetry({withRetryBackoff(makeConstantBackoff(10s, false))});

    std::thread canceller([ctx]{
        std::this_thread::sleep_for(30ms);
        ctx->cancel();
    });
    auto res = client.execute(req);
    canceller.join();

    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->kind == ErrorKind::canceled);
}


// ---------- gzip transcoding ----------------------------------------------------------

TEST_CASE("gzip encoded bodies are inflated transparently") {
    std::string text;
    for (int i = 0; i < 5000; ++i) text += "line " + std::to_string(i) + " of some highly repetitive text\n";

    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(200, gzipCompress(text), gzipHeaders())};
    Client client(ClientConfig{}, transport);

    auto res = client.get("http://example.com/gz");
    REQUIRE(res.has_value());
    auto body = res.get().content();
    REQUIRE(body.has_value());
    REQUIRE(body.get() == text);
}

TEST_CASE("concatenated gzip members decode as one stream") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(200, gzipCompress("hello, ") + gzipCompress("world"), gzipHeaders())};
    Client client(ClientConfig{}, transport);

    auto res = client.get("http://example.com/gz");
    REQUIRE(res.has_value());
    REQUIRE(res.get().content().get() == "hello, world");
}

TEST_CASE("a bad gzip header fails the attempt") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(200, "definitely not gzip", gzipHeaders())};
    Client client(ClientConfig{}, transport);

    auto res = client.get("http://example.com/gz");
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->kind == ErrorKind::stream);
    REQUIRE(res.error->message == "gzip: invalid header");
}

TEST_CASE("an empty gzip-labelled body is left alone") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(204, "", gzipHeaders())};
    Client client(ClientConfig{}, transport);

    auto res = client.get("http://example.com/gz");
    REQUIRE(res.has_value());
    REQUIRE(res.get().content().get().empty());
}


// ---------- tracing -------------------------------------------------------------------

TEST_CASE("client trace captures the lifecycle of the final attempt") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {[](Request&, ITraceHooks* hooks) {
        REQUIRE(hooks != nullptr);
        using Clock = std::chrono::steady_clock;
        auto step = [&](ConnEvent ev) {
            std::this_thread::sleep_for(1ms);
            hooks->record(ev, Clock::now());
        };
        step(ConnEvent::getConn);
        step(ConnEvent::dnsStart);
        step(ConnEvent::dnsDone);
        step(ConnEvent::connectStart);
        step(ConnEvent::connectDone);
        step(ConnEvent::gotConn);
        hooks->gotConnInfo(ConnInfo{false, false, 0ns});
        step(ConnEvent::wroteRequest);
        step(ConnEvent::gotFirstResponseByte);
        std::this_thread::sleep_for(1ms);
        return Expected<Response>::success(respond(200, "ok"));
    }};
    Client client(ClientConfig{}, transport);

    auto res = client.get("http://example.com/trace", {enableClientTrace()});
    REQUIRE(res.has_value());
    auto ti = res.get().traceInfo();
    REQUIRE(ti.has_value());
    REQUIRE(ti->dnsLookupTime >= 1ms);
    REQUIRE(ti->tcpConnTime >= 1ms);
    REQUIRE(ti->tlsHandshakeTime == 0ns);
    REQUIRE(ti->connTime >= ti->dnsLookupTime + ti->tcpConnTime);
    REQUIRE(ti->serverTime >= 1ms);
    REQUIRE(ti->responseTime >= 1ms);
    REQUIRE(ti->totalTime >= ti->connTime + ti->serverTime + ti->responseTime);
}

TEST_CASE("no trace is attached unless enabled") {
    auto transport = std::make_shared<ScriptedTransport>();
    Client client(ClientConfig{}, transport);
    auto res = client.get("http://example.com/");
    REQUIRE(res.has_value());
    REQUIRE_FALSE(res.get().traceInfo().has_value());
}


// ---------- configuration and shortcuts --------------------------------------------------

TEST_CASE("verb shortcuts route through the receiving client") {
    auto transport = std::make_shared<ScriptedTransport>();
    Client client(ClientConfig{}, transport);

    REQUIRE(client.get("http://example.com/a").has_value());
    REQUIRE(client.put("http://example.com/b", {withText("x")}).has_value());
    REQUIRE(client.del("http://example.com/c").has_value());
    REQUIRE(client.send("PURGE", "http://example.com/d").has_value());

    REQUIRE(transport->methods == std::vector<std::string>{"GET", "PUT", "DELETE", "PURGE"});
    REQUIRE(transport->bodies[1] == "x");
}

TEST_CASE("a failing request hook stops send before the transport") {
    auto transport = std::make_shared<ScriptedTransport>();
    Client client(ClientConfig{}, transport);

    auto res = client.get("http://example.com/", {withQuery({{"a", "1"}}), [](Request&) {
        return Expected<void>::failure(ErrorKind::preparation, "bad hook");
    }});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error->message == "bad hook");
    REQUIRE(transport->calls == 0);

    REQUIRE_FALSE(client.get("not a url").has_value());
}

TEST_CASE("maxConcurrency from the config bounds parallel requests") {
    auto transport = std::make_shared<ScriptedTransport>();
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    transport->script = {[&](Request&, ITraceHooks*) {
        int now = ++inFlight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(10ms);
        --inFlight;
        return Expected<Response>::success(respond(200));
    }};

    ClientConfig cfg;
    cfg.maxConcurrency = 2;
    Client client(cfg, transport);

    std::atomic<int> ok{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&]{
            if (client.get("http://example.com/").has_value()) ++ok;
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(ok.load() == 8);
    REQUIRE(peak.load() <= 2);
}

TEST_CASE("debug stream from the config dumps the exchange") {
    auto transport = std::make_shared<ScriptedTransport>();
    HeaderMap h;
    h.set("Content-Type", "text/plain");
    transport->script = {reply(200, "pong", h)};

    std::ostringstream out;
    ClientConfig cfg;
    cfg.debugStream = &out;
    cfg.debugBody = true;
    Client client(cfg, transport);

    auto res = client.post("http://example.com/ping", {withText("ping")});
    REQUIRE(res.has_value());
    REQUIRE(res.get().content().get() == "pong");

    auto dump = out.str();
    REQUIRE(dump.find("> POST /ping HTTP/1.1\r\n") != std::string::npos);
    REQUIRE(dump.find("ping\r\n") != std::string::npos);
    REQUIRE(dump.find("< HTTP/1.1 200\r\n") != std::string::npos);
    REQUIRE(dump.find("pong\r\n") != std::string::npos);
}

TEST_CASE("retries are logged with structured fields") {
    auto sink = std::make_shared<CaptureSink>();
    auto lg = std::make_shared<logger::Logger>(sink);
    lg->setLevel(logger::LogLevel::warn);

    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {reply(429), reply(200)};

    ClientConfig cfg;
    cfg.logger = lg;
    Client client(cfg, transport);

    auto res = client.get("http://example.com/items", {enableRetry({withRetryBackoff(makeConstantBackoff(2ms, false))})});
    REQUIRE(res.has_value());
    REQUIRE(res.get().statusCode == 200);

    REQUIRE(sink->records.size() == 1);
    const auto& rec = sink->records[0];
    REQUIRE(rec.level == logger::LogLevel::warn);
    REQUIRE(rec.logger == "client");
    REQUIRE(rec.method == "GET");
    REQUIRE(rec.url == "http://example.com/items");
    REQUIRE(rec.httpStatus == 429);
    REQUIRE(rec.attempt == 0);
    REQUIRE(rec.waitMs == 2);
}

TEST_CASE("mustExecute throws on failure") {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->script = {fail("down")};
    Client client(ClientConfig{}, transport);

    auto req = makeRequest();
    REQUIRE_THROWS_AS(client.mustExecute(req), std::runtime_error);
}
