// logger.cpp
#include "logger.hpp"
#include <iostream>
#include <syncstream>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ghttp::logger {

    static const char* level_name(LogLevel l) {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    static std::string ts_iso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string formatRecord(const LogRecord& rec) {
        std::ostringstream out;
        out << ts_iso8601(rec.ts) << " [" << level_name(rec.level) << "] "
            << (rec.logger.empty() ? "ghttp" : rec.logger) << ": "
            << rec.msg;

        if (!rec.method.empty())   out << " method="  << rec.method;
        if (!rec.url.empty())      out << " url="     << rec.url;
        if (rec.httpStatus >= 0)   out << " http="    << rec.httpStatus;
        if (rec.attempt >= 0)      out << " attempt=" << rec.attempt;
        if (rec.waitMs >= 0)       out << " wait="    << rec.waitMs << "ms";
        return out.str();
    }

    // -------- StdoutSink: atomic per-line emission --------
    void StdoutSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cout);  // per-call buffered; flushes on destruction
        out << formatRecord(rec) << '\n';
    }

    // -------- FileSink: mutex-serialized writes --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        std::scoped_lock lk(mu_);
        if (!out_) return;
        out_ << formatRecord(rec) << '\n';
        out_.flush();
    }

    std::string redactCredentials(std::string_view text) {
        std::string out{text};

        for (std::string_view scheme : {"Bearer ", "Basic "}) {
            std::size_t pos = 0;
            while ((pos = out.find(scheme, pos)) != std::string::npos) {
                std::size_t begin = pos + scheme.size();
                std::size_t end = begin;
                while (end < out.size() && out[end] != ' ' && out[end] != '\r' && out[end] != '\n') ++end;
                out.replace(begin, end - begin, "******");
                pos = begin + 6;
            }
        }

        std::size_t pos = 0;
        while ((pos = out.find("token=", pos)) != std::string::npos) {
            std::size_t begin = pos + 6;
            std::size_t end = out.find('&', begin);
            if (end == std::string::npos) end = out.size();
            out.replace(begin, end - begin, "******");
            pos = begin + 6;
        }
        return out;
    }

} // namespace ghttp::logger
