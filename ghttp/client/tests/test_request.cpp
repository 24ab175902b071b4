#include <catch2/catch.hpp>

#include <string>

#include "../include/request.hpp"
#include "../include/response.hpp"
#include "../include/types.hpp"

using namespace ghttp;


static Request makeRequest(const std::string& url = "https://httpbin.org/post") {
    auto req = Request::create(method::post, url);
    REQUIRE(req.has_value());
    return std::move(req.get());
}


// ---------- construction ------------------------------------------------------

TEST_CASE("create rejects bad methods and URLs") {
    REQUIRE_FALSE(Request::create("GET POST", "http://example.com").has_value());
    REQUIRE_FALSE(Request::create(method::get, "example.com/no-scheme").has_value());
    REQUIRE_FALSE(Request::create(method::get, "ftp://example.com/").has_value());
    REQUIRE_FALSE(Request::create(method::get, "http:///path").has_value());

    auto bad = Request::create(method::get, "gopher://x");
    REQUIRE(bad.error->kind == ErrorKind::preparation);
}

TEST_CASE("create parses the request target") {
    auto req = Request::create("", "HTTPS://httpbin.org:8443/anything?a=1#frag");
    REQUIRE(req.has_value());
    REQUIRE(req.get().method() == "GET");
    REQUIRE(req.get().target().scheme == "https");
    REQUIRE(req.get().target().host == "httpbin.org:8443");
    REQUIRE(req.get().target().path == "/anything?a=1");
    REQUIRE(req.get().context() != nullptr);
}


// ---------- headers ---------------------------------------------------------------

TEST_CASE("header map is case-insensitive and keeps the first spelling") {
    HeaderMap h;
    h.set("Content-Type", "text/plain");
    h.append("X-Multi", "1");
    h.append("x-multi", "2");
    h.set("content-type", "application/json");

    REQUIRE(h.get("CONTENT-TYPE") == "application/json");
    REQUIRE(h.begin()->first == "Content-Type");
    REQUIRE(h.getAll("X-MULTI") == std::vector<std::string>{"1", "2"});

    h.set("X-Multi", "3");
    REQUIRE(h.getAll("x-multi") == std::vector<std::string>{"3"});
    h.remove("X-MULTI");
    REQUIRE_FALSE(h.has("x-multi"));
    REQUIRE(h.size() == 1);
}

TEST_CASE("auth helpers set the Authorization header") {
    auto req = makeRequest();
    req.setBearerToken("ghttp");
    REQUIRE(req.headers.get("Authorization") == "Bearer ghttp");

    req.setBasicAuth("admin", "pass");
    REQUIRE(req.headers.get("Authorization") == "Basic YWRtaW46cGFzcw==");
}


// ---------- query -------------------------------------------------------------------

TEST_CASE("queryEscape and encodeParams follow form encoding") {
    REQUIRE(queryEscape("a b&c=d/é") == "a+b%26c%3Dd%2F%C3%A9");
    REQUIRE(encodeParams({{"b", "2"}, {"a", "1"}, {"b", "1"}}) == "a=1&b=2&b=1");
    REQUIRE(encodeParams({}).empty());
}

TEST_CASE("setQuery replaces given keys and keeps the others") {
    auto req = makeRequest("http://example.com/search?q=old&page=2#top");
    REQUIRE(req.setQuery({{"q", "new value"}, {"lang", "c++"}}).has_value());
    REQUIRE(req.url() == "http://example.com/search?page=2&lang=c%2B%2B&q=new+value#top");
    REQUIRE(req.target().path == "/search?page=2&lang=c%2B%2B&q=new+value");
}

TEST_CASE("withQuery hook on a URL without a query") {
    auto req = makeRequest("http://example.com/get");
    REQUIRE(withQuery({{"k", "v"}})(req).has_value());
    REQUIRE(req.url() == "http://example.com/get?k=v");
}


// ---------- bodies -------------------------------------------------------------------

TEST_CASE("setContent installs a replayable body") {
    auto req = makeRequest();
    req.setContent("hello");
    REQUIRE(req.contentLength() == 5);
    REQUIRE(req.getBody());

    auto first = drainToString(*req.body());
    REQUIRE(first.get() == "hello");

    REQUIRE(req.rewindBody().has_value());
    auto again = drainToString(*req.body());
    REQUIRE(again.get() == "hello");
}

TEST_CASE("empty content leaves no body") {
    auto req = makeRequest();
    req.setContent("");
    REQUIRE(req.body() == nullptr);
    REQUIRE(req.contentLength() == 0);
    REQUIRE(req.rewindBody().has_value());
    REQUIRE(req.body() == nullptr);
}

TEST_CASE("text and form helpers set body and content type") {
    auto req = makeRequest();
    req.setText("hi there");
    REQUIRE(req.headers.get("Content-Type") == "text/plain; charset=utf-8");
    REQUIRE(drainToString(*req.body()).get() == "hi there");

    req.setForm({{"lang", "c++"}, {"k", "a b"}});
    REQUIRE(req.headers.get("Content-Type") == "application/x-www-form-urlencoded");
    REQUIRE(drainToString(*req.body()).get() == "k=a+b&lang=c%2B%2B");
}

TEST_CASE("setBody drops any replay function") {
    auto req = makeRequest();
    req.setContent("abc");
    req.setBody(std::make_unique<StringBody>("xyz"));
    REQUIRE_FALSE(req.getBody());
    REQUIRE(req.contentLength() == 3);
}

TEST_CASE("reading a closed string body fails") {
    StringBody b("abc");
    b.close();
    char buf[4];
    auto r = b.read(buf, sizeof(buf));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error->kind == ErrorKind::stream);
}


// ---------- options -------------------------------------------------------------------

TEST_CASE("hooks flag retry, tracing and context") {
    auto req = makeRequest();
    auto ctx = Context::withCancel();

    REQUIRE(enableRetry()(req).has_value());
    REQUIRE(enableClientTrace()(req).has_value());
    REQUIRE(withContext(ctx)(req).has_value());
    REQUIRE(withHeaders({{"X-Test", "1"}})(req).has_value());
    REQUIRE(withUserAgent("ghttp-test")(req).has_value());

    REQUIRE(req.retrier() != nullptr);
    REQUIRE(req.clientTraceEnabled());
    REQUIRE(req.context() == ctx);
    REQUIRE(req.headers.get("X-Test") == "1");
    REQUIRE(req.headers.get("User-Agent") == "ghttp-test");

    req.setContext(nullptr);
    REQUIRE(req.context() != nullptr);
    REQUIRE(req.context() != ctx);
}

TEST_CASE("response content reads and closes the body") {
    Response resp;
    resp.body = std::make_unique<StringBody>("payload");
    auto c = resp.content();
    REQUIRE(c.get() == "payload");
    REQUIRE_FALSE(resp.content().has_value());   // already consumed and closed

    Response empty;
    REQUIRE(empty.content().get().empty());
    REQUIRE_FALSE(empty.traceInfo().has_value());
}
