#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../ghttp/client/include/backoff.hpp"
#include "../ghttp/client/include/client.hpp"
#include "../ghttp/client/include/multipart.hpp"
#include "../ghttp/client/include/retry.hpp"
#include "../ghttp/logger/logger.hpp"

using namespace ghttp;


struct CliOptions {
    std::string method;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::string> data;
    Form form;
    Files files;

    bool verbose{false};
    bool includeHeaders{false};
    bool trace{false};
    bool json{false};
    std::optional<int> retries;
    std::string backoff{"exp"};
    std::optional<double> timeoutSeconds;
    std::optional<double> rate;
    std::optional<std::string> output;
    std::optional<std::string> logFile;
    logger::LogLevel logLevel{logger::LogLevel::info};
};


static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] [METHOD] URL\n"
              << "  -v                  dump request and response traffic to stderr\n"
              << "  -i                  print status line and headers before the body\n"
              << "  -H 'Key: Value'     add a request header (repeatable)\n"
              << "  -d DATA             send DATA as the request body\n"
              << "  -F key=value        add a multipart form field (repeatable)\n"
              << "  -F key=@file        add a multipart file (repeatable)\n"
              << "  -o FILE             save the body to FILE\n"
              << "  --retry N           retry up to N times on errors and 429\n"
              << "  --backoff exp|const|fib\n"
              << "  --trace             print connection timings to stderr\n"
              << "  --timeout SECONDS   overall deadline including retries\n"
              << "  --rate R            client-side limit in requests per second\n"
              << "  --json              print status, headers and timings as JSON\n"
              << "  --log FILE          write client logs to FILE\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error\n";
}


static std::optional<logger::LogLevel> parseLevel(const std::string& s) {
    if (s == "trace") return logger::LogLevel::trace;
    if (s == "debug") return logger::LogLevel::debug;
    if (s == "info")  return logger::LogLevel::info;
    if (s == "warn")  return logger::LogLevel::warn;
    if (s == "error") return logger::LogLevel::error;
    return std::nullopt;
}


static bool looksLikeMethod(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}


// Returns an error message, empty on success.
static std::string parseArgs(int argc, char* argv[], CliOptions& opts) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string val;

        if (arg == "-v") opts.verbose = true;
        else if (arg == "-i") opts.includeHeaders = true;
        else if (arg == "--trace") opts.trace = true;
        else if (arg == "--json") opts.json = true;
        else if (arg == "-H") {
            if (!next(val)) return "-H needs a value";
            auto colon = val.find(':');
            if (colon == std::string::npos) return "bad header `" + val + "`";
            auto value = val.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            opts.headers.emplace_back(val.substr(0, colon), value);
        }
        else if (arg == "-d") {
            if (!next(val)) return "-d needs a value";
            opts.data = val;
        }
        else if (arg == "-F") {
            if (!next(val)) return "-F needs a value";
            auto eq = val.find('=');
            if (eq == std::string::npos) return "bad form field `" + val + "`";
            auto key = val.substr(0, eq);
            auto value = val.substr(eq + 1);
            if (!value.empty() && value[0] == '@') {
                auto f = File::open(value.substr(1));
                if (!f.has_value()) return f.error->message;
                opts.files.emplace_back(key, f.get());
            } else {
                opts.form.emplace_back(key, value);
            }
        }
        else if (arg == "-o") {
            if (!next(val)) return "-o needs a value";
            opts.output = val;
        }
        else if (arg == "--retry") {
            if (!next(val)) return "--retry needs a value";
            opts.retries = std::atoi(val.c_str());
        }
        else if (arg == "--backoff") {
            if (!next(val)) return "--backoff needs a value";
            if (val != "exp" && val != "const" && val != "fib") return "unknown backoff `" + val + "`";
            opts.backoff = val;
        }
        else if (arg == "--timeout") {
            if (!next(val)) return "--timeout needs a value";
            opts.timeoutSeconds = std::atof(val.c_str());
        }
        else if (arg == "--rate") {
            if (!next(val)) return "--rate needs a value";
            opts.rate = std::atof(val.c_str());
        }
        else if (arg == "--log") {
            if (!next(val)) return "--log needs a value";
            opts.logFile = val;
        }
        else if (arg == "--log-level") {
            if (!next(val)) return "--log-level needs a value";
            auto lvl = parseLevel(val);
            if (!lvl) return "unknown log level `" + val + "`";
            opts.logLevel = *lvl;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option " + arg;
        }
        else positional.push_back(arg);
    }

    if (positional.size() == 2 && looksLikeMethod(positional[0])) {
        opts.method = positional[0];
        opts.url = positional[1];
    } else if (positional.size() == 1) {
        opts.url = positional[0];
    } else {
        return "expected [METHOD] URL";
    }

    if (opts.method.empty()) {
        opts.method = (opts.data || !opts.form.empty() || !opts.files.empty()) ? method::post : method::get;
    }
    return {};
}


static BackoffPtr makeBackoff(const std::string& name) {
    using namespace std::chrono_literals;
    if (name == "const") return makeConstantBackoff(1s, true);
    if (name == "fib") return makeFibonacciBackoff(30, 1s);
    return makeExponentialBackoff(1s, 30s, true);
}


static nlohmann::ordered_json summarize(const Response& resp) {
    nlohmann::ordered_json out;
    out["status"] = resp.statusCode;
    out["proto"] = resp.proto;
    out["url"] = resp.effectiveUrl;

    nlohmann::ordered_json headers = nlohmann::ordered_json::object();
    for (auto const& [k, v] : resp.headers) {
        headers[k].push_back(v);
    }
    out["headers"] = headers;

    if (auto ti = resp.traceInfo()) {
        auto ms = [](std::chrono::nanoseconds d) { return static_cast<double>(d.count()) / 1e6; };
        out["trace"] = {
            {"dns_ms", ms(ti->dnsLookupTime)},
            {"connect_ms", ms(ti->tcpConnTime)},
            {"tls_ms", ms(ti->tlsHandshakeTime)},
            {"conn_ms", ms(ti->connTime)},
            {"server_ms", ms(ti->serverTime)},
            {"response_ms", ms(ti->responseTime)},
            {"total_ms", ms(ti->totalTime)},
            {"reused", ti->connReused},
            {"idle_ms", ms(ti->connIdleTime)},
        };
    }
    return out;
}


int main(int argc, char *argv[])
{
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    CliOptions opts;
    if (auto err = parseArgs(argc, argv, opts); !err.empty()) {
        std::cerr << "ghttp: " << err << "\n";
        usage(argv[0]);
        return 2;
    }

    ClientConfig cfg;
    if (opts.logFile) {
        cfg.logger = std::make_shared<logger::Logger>(std::make_shared<logger::FileSink>(*opts.logFile));
        cfg.logger->setLevel(opts.logLevel);
        cfg.logger->setRedactor([](std::string_view s){ return logger::redactCredentials(s); });
    }
    if (opts.rate) cfg.rateLimit = *opts.rate;
    if (opts.verbose) {
        cfg.debugStream = &std::cerr;
        cfg.debugBody = true;
    }
    Client client(cfg);

    auto created = Request::create(opts.method, opts.url);
    if (!created.has_value()) {
        std::cerr << "ghttp: " << created.error->message << "\n";
        return 2;
    }
    Request& req = created.get();

    req.setHeaders(opts.headers);
    if (opts.data) {
        req.setContent(*opts.data);
    } else if (!opts.files.empty()) {
        auto res = withFiles(opts.files, opts.form)(req);
        if (!res.has_value()) {
            std::cerr << "ghttp: " << res.error->message << "\n";
            return 2;
        }
    } else if (!opts.form.empty()) {
        req.setForm(opts.form);
    }

    if (opts.retries) {
        req.enableRetry({withRetryMaxAttempts(*opts.retries), withRetryBackoff(makeBackoff(opts.backoff))});
    }
    if (opts.trace || opts.json) req.enableClientTrace();
    if (opts.timeoutSeconds) {
        auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(*opts.timeoutSeconds));
        req.setContext(Context::withTimeout(timeout));
    }

    auto res = client.execute(req);
    if (!res.has_value()) {
        std::cerr << "ghttp: " << toString(res.error->kind) << ": " << res.error->message << "\n";
        return 1;
    }
    Response& resp = res.get();

    if (opts.json) {
        resp.close();
        std::cout << summarize(resp).dump(2) << "\n";
        return resp.statusCode >= 400 ? 1 : 0;
    }

    if (opts.includeHeaders) {
        std::cout << resp.proto << " " << resp.status << "\n";
        for (auto const& [k, v] : resp.headers) {
            std::cout << k << ": " << v << "\n";
        }
        std::cout << "\n";
    }

    if (opts.output) {
        auto saved = resp.saveFile(*opts.output);
        if (!saved.has_value()) {
            std::cerr << "ghttp: " << saved.error->message << "\n";
            return 1;
        }
    } else if (resp.body) {
        auto body = drainBody(*resp.body, std::cout);
        if (!body.has_value()) {
            std::cerr << "ghttp: " << body.error->message << "\n";
            return 1;
        }
    }

    if (opts.trace) {
        if (auto ti = resp.traceInfo()) std::cerr << ti->toString();
    }
    return resp.statusCode >= 400 ? 1 : 0;
}
