#include <algorithm>
#include "../include/pipe.hpp"


namespace ghttp {


    Expected<void> BytePipe::write(const char* src, std::size_t len) {
        std::unique_lock lk(mu_);
        while (len > 0) {
            cv_.wait(lk, [this]{ return readClosed_ || writeClosed_ || buf_.size() < capacity_; });
            if (readClosed_) return Expected<void>::failure(ErrorKind::stream, "io: read/write on closed pipe");
            if (writeClosed_) return Expected<void>::failure(ErrorKind::stream, "io: write on closed pipe");

            std::size_t n = std::min(len, capacity_ - buf_.size());
            buf_.insert(buf_.end(), src, src + n);
            src += n;
            len -= n;
            cv_.notify_all();
        }
        return Expected<void>::success();
    }


    Expected<std::size_t> BytePipe::read(char* dst, std::size_t len) {
        std::unique_lock lk(mu_);
        if (readClosed_) return Expected<std::size_t>::failure(ErrorKind::stream, "io: read/write on closed pipe");
        if (len == 0) return Expected<std::size_t>::success(0);

        cv_.wait(lk, [this]{ return !buf_.empty() || writeClosed_ || readClosed_; });
        if (buf_.empty()) {
            if (writeErr_) return Expected<std::size_t>::failure(*writeErr_);
            return Expected<std::size_t>::success(0);
        }

        std::size_t n = std::min(len, buf_.size());
        std::copy_n(buf_.begin(), n, dst);
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n));
        cv_.notify_all();
        return Expected<std::size_t>::success(n);
    }


    void BytePipe::closeWrite(std::optional<Error> err) {
        {
            std::scoped_lock lk(mu_);
            if (writeClosed_) return;
            writeClosed_ = true;
            writeErr_ = std::move(err);
        }
        cv_.notify_all();
    }


    void BytePipe::closeRead() {
        {
            std::scoped_lock lk(mu_);
            readClosed_ = true;
            buf_.clear();
        }
        cv_.notify_all();
    }


} // namespace ghttp
