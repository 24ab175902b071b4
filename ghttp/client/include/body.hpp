#pragma once
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include "expected.hpp"


namespace ghttp {


    /**
     * @brief Pull-style byte source used for request and response bodies.
     *
     * read() returns the number of bytes copied into dst; 0 means end of stream.
     * A body has a single consumer and is closed exactly once by its owner.
     */
    struct IBodyReader
    {
        virtual ~IBodyReader() = default;
        virtual Expected<std::size_t> read(char* dst, std::size_t len) = 0;
        virtual void close() {}
        // Bytes left to read, or -1 when unknown.
        virtual std::int64_t length() const { return -1; }
    };

    using BodyPtr = std::unique_ptr<IBodyReader>;
    using GetBodyFn = std::function<Expected<BodyPtr>()>;


    // In-memory body; cheap to replay through a GetBodyFn.
    class StringBody : public IBodyReader
    {
    public:
        explicit StringBody(std::string data) : data_(std::move(data)) {}

        Expected<std::size_t> read(char* dst, std::size_t len) override;
        void close() override { closed_ = true; }
        std::int64_t length() const override { return static_cast<std::int64_t>(data_.size() - pos_); }

    private:
        std::string data_;
        std::size_t pos_{0};
        bool closed_{false};
    };


    // Streams a file from disk; the descriptor is released by close() or the destructor.
    class FileBody : public IBodyReader
    {
    public:
        static Expected<std::unique_ptr<FileBody>> open(const std::string& path);
        ~FileBody() override;

        Expected<std::size_t> read(char* dst, std::size_t len) override;
        void close() override;
        std::int64_t length() const override { return remaining_; }

    private:
        FileBody(std::FILE* f, std::int64_t size) : file_(f), remaining_(size) {}
        std::FILE* file_{nullptr};
        std::int64_t remaining_{-1};
    };


    // Reports whether a request or response body carries no bytes.
    bool bodyEmpty(const BodyPtr& body);

    // Copies the body into sink until end of stream, then closes it.
    Expected<std::size_t> drainBody(IBodyReader& body, std::ostream& sink);
    Expected<std::string> drainToString(IBodyReader& body);

    // Copies exactly until end of stream; used by the multipart producer.
    using WriteFn = std::function<Expected<void>(const char*, std::size_t)>;
    Expected<std::size_t> copyBody(IBodyReader& body, const WriteFn& write);


} // namespace ghttp
