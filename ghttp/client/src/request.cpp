#include <algorithm>
#include <cctype>
#include <openssl/evp.h>
#include "../include/request.hpp"
#include "../include/retry.hpp"
#include "../include/multipart.hpp"


namespace ghttp {


    Expected<Url> parseUrl(std::string_view raw) {
        auto sep = raw.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return Expected<Url>::failure(ErrorKind::preparation, "parse \"" + std::string(raw) + "\": missing scheme");
        }

        Url u;
        u.scheme.assign(raw.substr(0, sep));
        std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (u.scheme != "http" && u.scheme != "https" && u.scheme != "file") {
            return Expected<Url>::failure(ErrorKind::preparation, "unsupported protocol scheme \"" + u.scheme + "\"");
        }

        auto rest = raw.substr(sep + 3);
        auto slash = rest.find_first_of("/?#");
        u.host.assign(rest.substr(0, slash));
        if (slash != std::string_view::npos) {
            auto target = rest.substr(slash);
            target = target.substr(0, target.find('#'));
            u.path.assign(target);
            if (u.path.empty() || u.path[0] != '/') u.path.insert(0, "/");
        }

        if (u.host.empty() && u.scheme != "file") {
            return Expected<Url>::failure(ErrorKind::preparation, "parse \"" + std::string(raw) + "\": missing host");
        }
        for (unsigned char c : u.host) {
            if (std::isspace(c) || std::iscntrl(c)) {
                return Expected<Url>::failure(ErrorKind::preparation, "parse \"" + std::string(raw) + "\": invalid character in host");
            }
        }
        return Expected<Url>::success(std::move(u));
    }


    Request::Request(std::string method, std::string url, Url target)
        : method_(std::move(method)), url_(std::move(url)), target_(std::move(target)), ctx_(Context::background()) {}


    Expected<Request> Request::create(std::string method, std::string url) {
        if (method.empty()) method = method::get;
        for (unsigned char c : method) {
            if (!std::isalpha(c) && c != '-') {
                return Expected<Request>::failure(ErrorKind::preparation, "invalid method \"" + method + "\"");
            }
        }

        auto target = parseUrl(url);
        if (!target.has_value()) return Expected<Request>::failure(*target.error);
        return Expected<Request>::success(Request(std::move(method), std::move(url), std::move(target.get())));
    }


    Expected<void> Request::setUrl(std::string url) {
        auto target = parseUrl(url);
        if (!target.has_value()) return Expected<void>::failure(*target.error);
        url_ = std::move(url);
        target_ = std::move(target.get());
        return Expected<void>::success();
    }


    void Request::setHeaders(const std::vector<std::pair<std::string, std::string>>& kv) {
        for (auto const& [k, v] : kv) headers.set(k, v);
    }


    void Request::setBasicAuth(const std::string& username, const std::string& password) {
        const std::string raw = username + ":" + password;
        std::string encoded(4 * ((raw.size() + 2) / 3) + 1, '\0');
        int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                reinterpret_cast<const unsigned char*>(raw.data()), static_cast<int>(raw.size()));
        encoded.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
        headers.set("Authorization", "Basic " + encoded);
    }


    static Params splitQuery(std::string_view query) {
        Params out;
        while (!query.empty()) {
            auto amp = query.find('&');
            auto pair = query.substr(0, amp);
            if (!pair.empty()) {
                auto eq = pair.find('=');
                if (eq == std::string_view::npos) out.emplace_back(std::string(pair), std::string());
                else out.emplace_back(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
            }
            if (amp == std::string_view::npos) break;
            query.remove_prefix(amp + 1);
        }
        return out;
    }


    Expected<void> Request::setQuery(const Params& params) {
        auto q = url_.find('?');
        std::string base = url_.substr(0, q);
        std::string frag;
        if (auto h = url_.find('#'); h != std::string::npos) {
            frag = url_.substr(h);
            if (q == std::string::npos || q > h) base = url_.substr(0, h);
        }

        // existing pairs stay encoded as written; replaced keys are dropped
        Params kept;
        if (q != std::string::npos) {
            auto end = url_.find('#', q);
            for (auto& kv : splitQuery(std::string_view(url_).substr(q + 1, end == std::string::npos ? std::string::npos : end - q - 1))) {
                bool replaced = std::any_of(params.begin(), params.end(),
                                            [&](const auto& p){ return queryEscape(p.first) == kv.first; });
                if (!replaced) kept.push_back(std::move(kv));
            }
        }

        std::string query;
        for (auto const& [k, v] : kept) {
            if (!query.empty()) query += '&';
            query += k + "=" + v;
        }
        auto encoded = encodeParams(params);
        if (!encoded.empty()) {
            if (!query.empty()) query += '&';
            query += encoded;
        }

        std::string next = base;
        if (!query.empty()) next += "?" + query;
        next += frag;
        return setUrl(std::move(next));
    }


    void Request::setBody(BodyPtr body, std::int64_t contentLength) {
        body_ = std::move(body);
        getBody_ = nullptr;
        contentLength_ = body_ ? (contentLength >= 0 ? contentLength : body_->length()) : 0;
    }


    void Request::setContent(std::string content) {
        if (content.empty()) {
            body_.reset();
            contentLength_ = 0;
            getBody_ = []{ return Expected<BodyPtr>::success(nullptr); };
            return;
        }

        auto snapshot = std::make_shared<const std::string>(std::move(content));
        contentLength_ = static_cast<std::int64_t>(snapshot->size());
        body_ = std::make_unique<StringBody>(*snapshot);
        getBody_ = [snapshot]{ return Expected<BodyPtr>::success(std::make_unique<StringBody>(*snapshot)); };
    }


    void Request::setText(std::string text) {
        setContent(std::move(text));
        setContentType("text/plain; charset=utf-8");
    }


    void Request::setForm(const Form& form) {
        setContent(encodeParams(form));
        setContentType("application/x-www-form-urlencoded");
    }


    void Request::setFiles(std::unique_ptr<FormData> formData) {
        if (!formData) {
            setBody(nullptr);
            return;
        }
        setContentType(formData->contentType());
        setBody(std::move(formData));
    }


    Expected<void> Request::rewindBody() {
        if (!getBody_) return Expected<void>::success();
        auto b = getBody_();
        if (!b.has_value()) return Expected<void>::failure(*b.error);
        body_ = std::move(b.get());
        return Expected<void>::success();
    }


    void Request::enableRetry(const std::vector<RetryOption>& opts) {
        auto r = std::make_shared<Retrier>();
        for (auto const& opt : opts) {
            if (opt) opt(*r);
        }
        retrier_ = std::move(r);
    }


    // ---- hooks ----

    RequestHook withHeaders(std::vector<std::pair<std::string, std::string>> kv) {
        return [kv = std::move(kv)](Request& req) { req.setHeaders(kv); return Expected<void>::success(); };
    }

    RequestHook withQuery(Params params) {
        return [params = std::move(params)](Request& req) { return req.setQuery(params); };
    }

    RequestHook withContentType(std::string contentType) {
        return [v = std::move(contentType)](Request& req) { req.setContentType(v); return Expected<void>::success(); };
    }

    RequestHook withUserAgent(std::string userAgent) {
        return [v = std::move(userAgent)](Request& req) { req.setUserAgent(v); return Expected<void>::success(); };
    }

    RequestHook withBearerToken(std::string token) {
        return [v = std::move(token)](Request& req) { req.setBearerToken(v); return Expected<void>::success(); };
    }

    RequestHook withBasicAuth(std::string username, std::string password) {
        return [u = std::move(username), p = std::move(password)](Request& req) {
            req.setBasicAuth(u, p);
            return Expected<void>::success();
        };
    }

    RequestHook withContent(std::string content) {
        return [v = std::move(content)](Request& req) { req.setContent(v); return Expected<void>::success(); };
    }

    RequestHook withText(std::string text) {
        return [v = std::move(text)](Request& req) { req.setText(v); return Expected<void>::success(); };
    }

    RequestHook withForm(Form form) {
        return [v = std::move(form)](Request& req) { req.setForm(v); return Expected<void>::success(); };
    }

    RequestHook withContext(ContextPtr ctx) {
        return [ctx = std::move(ctx)](Request& req) { req.setContext(ctx); return Expected<void>::success(); };
    }

    RequestHook enableRetry(std::vector<RetryOption> opts) {
        return [opts = std::move(opts)](Request& req) { req.enableRetry(opts); return Expected<void>::success(); };
    }

    RequestHook enableClientTrace() {
        return [](Request& req) { req.enableClientTrace(); return Expected<void>::success(); };
    }


} // namespace ghttp
