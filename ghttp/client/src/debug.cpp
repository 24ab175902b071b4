#include "../include/debug.hpp"


namespace ghttp {


    Expected<void> Debugger::dumpRequest(Request& req) {
        out_ << "> " << req.method() << " " << req.target().path << " HTTP/1.1\r\n";
        if (!req.target().host.empty()) out_ << "> Host: " << req.target().host << "\r\n";
        for (auto const& [k, v] : req.headers) {
            if (equalsIgnoreCase(k, "Host") || equalsIgnoreCase(k, "Transfer-Encoding") || equalsIgnoreCase(k, "Trailer")) continue;
            out_ << "> " << k << ": " << v << "\r\n";
        }
        out_ << ">\r\n";

        if (!body_ || bodyEmpty(req.bodyPtr())) return Expected<void>::success();

        auto captured = drainToString(*req.body());
        if (!captured.has_value()) return Expected<void>::failure(*captured.error);
        out_ << captured.get() << "\r\n";
        req.setContent(std::move(captured.get()));
        return Expected<void>::success();
    }


    Expected<void> Debugger::dumpResponse(Response& resp) {
        out_ << "< " << resp.proto << " " << resp.status << "\r\n";
        for (auto const& [k, v] : resp.headers) {
            out_ << "< " << k << ": " << v << "\r\n";
        }
        out_ << "<\r\n";

        if (!body_ || bodyEmpty(resp.body)) return Expected<void>::success();

        auto captured = drainToString(*resp.body);
        if (!captured.has_value()) return Expected<void>::failure(*captured.error);
        out_ << captured.get() << "\r\n";
        resp.body = std::make_unique<StringBody>(std::move(captured.get()));
        return Expected<void>::success();
    }


    void Debugger::dumpError(const Error& err) {
        out_ << "* ghttp [ERROR] " << err.message << "\r\n";
    }


    Expected<void> Debugger::enter(Request& req) {
        std::scoped_lock lk(mu_);
        auto res = dumpRequest(req);
        if (!res.has_value()) dumpError(*res.error);
        out_.flush();
        return res;
    }


    void Debugger::exit(Response* resp, const Error* err) {
        std::scoped_lock lk(mu_);
        if (err) {
            dumpError(*err);
        } else if (resp) {
            auto res = dumpResponse(*resp);
            if (!res.has_value()) dumpError(*res.error);
        }
        out_.flush();
    }


} // namespace ghttp
