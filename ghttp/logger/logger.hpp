#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace ghttp::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    struct LogRecord
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "client", "multipart"
        std::string msg;           // rendered text

        // Optional structured fields:
        std::string method;        // GET, POST, ...
        std::string url;           // request URL (redacted)
        int         httpStatus{-1};
        int         attempt{-1};
        long long   waitMs{-1};    // backoff before the next attempt
    };

    class ILoggerSink
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    class StdoutSink : public ILoggerSink
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink
    {
    public:
        explicit FileSink(const std::string& path);
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    // Renders one record the way the bundled sinks print it (no trailing newline).
    std::string formatRecord(const LogRecord& rec);

    class Logger
    {
    public:
        using RedactorFn = std::function<std::string(std::string_view)>;

        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StdoutSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }
        bool enabled(LogLevel lvl) const { return static_cast<unsigned>(lvl) >= static_cast<unsigned>(level()); }

        void setRedactor(RedactorFn r) { std::scoped_lock lk(mu_); redactor_ = std::move(r); }

        void log(LogRecord rec) {
            if (!enabled(rec.level)) return;
            rec.ts = std::chrono::system_clock::now();
            {
                std::scoped_lock lk(mu_);
                if (redactor_) {
                    rec.url = redactor_(rec.url);
                    rec.msg = redactor_(rec.msg);
                }
            }
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::mutex mu_;
        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
        RedactorFn redactor_;
    };

    // Replaces the credentials of an Authorization-style "Bearer xxx" / "Basic xxx"
    // value and any "token=" query parameter with asterisks.
    std::string redactCredentials(std::string_view text);

    #ifndef GHTTP_LOG_LEVEL
    #define GHTTP_LOG_LEVEL ghttp::logger::LogLevel::debug
    #endif

    #define GHTTP_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(GHTTP_LOG_LEVEL))

    // Usage: GHTTP_LOG(loggerPtr, LogLevel::debug, "client") << "message " << x;
    #define GHTTP_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !GHTTP_LOG_ENABLED(LVL) || !(LOGGER_PTR)->enabled(LVL)) ; \
        else ::ghttp::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME), __func__, __LINE__).stream()

    namespace detail {
        class LogStreamHelper
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* name, const char* fn, int line)
            : lg_(lg) { ss_ << "[" << fn << ":" << line << "] "; rec_.level = lvl; rec_.logger = name; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
            LogRecord rec_;
        private:
            Logger& lg_;
            std::ostringstream ss_;
        };
    }

} // namespace ghttp::logger
