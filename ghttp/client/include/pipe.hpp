#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "expected.hpp"


namespace ghttp {


    /**
     * @brief Bounded in-memory pipe between one writer thread and one reader.
     *
     * write() blocks while the buffer is full; read() blocks while it is empty.
     * Closing the write end delivers end of stream after buffered bytes drain.
     * Closing the read end makes pending and future writes fail.
     */
    class BytePipe
    {
    public:
        explicit BytePipe(std::size_t capacity = 64 * 1024) : capacity_(capacity ? capacity : 1) {}

        BytePipe(const BytePipe&) = delete;
        BytePipe& operator=(const BytePipe&) = delete;

        Expected<void> write(const char* src, std::size_t len);
        Expected<std::size_t> read(char* dst, std::size_t len);

        // An error set here is returned by read() once the buffer is empty.
        void closeWrite(std::optional<Error> err = std::nullopt);
        void closeRead();

    private:
        const std::size_t capacity_;
        std::mutex mu_;
        std::condition_variable cv_;
        std::deque<char> buf_;
        bool writeClosed_{false};
        bool readClosed_{false};
        std::optional<Error> writeErr_;
    };


} // namespace ghttp
