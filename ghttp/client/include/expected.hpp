#pragma once
#include <optional>
#include <string>


namespace ghttp {

    enum class ErrorKind {
        preparation,        // malformed request, hook rejection, body capture
        transport,          // network / DNS / TLS failure
        stream,             // reading or decoding a body
        canceled,           // context cancelled
        deadlineExceeded    // context deadline passed
    };

    struct Error {
    ErrorKind kind{ErrorKind::transport};
    std::string message;

    bool isCancellation() const { return kind == ErrorKind::canceled || kind == ErrorKind::deadlineExceeded; }
    };

    const char* toString(ErrorKind kind);


    template <typename T>
    struct Expected
    {
        std::optional<T> value;
        std::optional<Error> error;


        static Expected success(T v) {
            Expected e; e.value = std::move(v);
            return e;
        }
        static Expected failure(Error err) {
            Expected e; e.error = std::move(err);
            return e;
        }
        static Expected failure(ErrorKind kind, std::string msg) {
            return failure(Error{kind, std::move(msg)});
        }
        static Expected failure(std::string msg) {
            return failure(Error{ErrorKind::transport, std::move(msg)});
        }
        bool has_value() const { return value.has_value(); }
        T& get() { return *value; }
        const T& get() const { return *value; }
    };


    template <>
    struct Expected<void>
    {
        std::optional<Error> error;
        static Expected success() { return {}; }
        static Expected failure(Error err) { Expected e; e.error = std::move(err); return e; }
        static Expected failure(ErrorKind kind, std::string msg) { return failure(Error{kind, std::move(msg)}); }
        static Expected failure(std::string msg) { return failure(Error{ErrorKind::transport, std::move(msg)}); }
        bool has_value() const { return !error.has_value(); }
    };


} // namespace ghttp
