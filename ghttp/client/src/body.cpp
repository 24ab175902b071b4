#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <sys/stat.h>
#include "../include/body.hpp"


namespace ghttp {


    Expected<std::size_t> StringBody::read(char* dst, std::size_t len) {
        if (closed_) return Expected<std::size_t>::failure(ErrorKind::stream, "read on closed body");
        std::size_t n = std::min(len, data_.size() - pos_);
        if (n > 0) std::memcpy(dst, data_.data() + pos_, n);
        pos_ += n;
        return Expected<std::size_t>::success(n);
    }


    Expected<std::unique_ptr<FileBody>> FileBody::open(const std::string& path) {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            return Expected<std::unique_ptr<FileBody>>::failure(
                ErrorKind::preparation, "open " + path + ": " + std::strerror(errno));
        }

        std::int64_t size = -1;
        struct stat st{};
        if (::fstat(::fileno(f), &st) == 0 && S_ISREG(st.st_mode)) size = static_cast<std::int64_t>(st.st_size);

        return Expected<std::unique_ptr<FileBody>>::success(std::unique_ptr<FileBody>(new FileBody(f, size)));
    }

    FileBody::~FileBody() { close(); }

    Expected<std::size_t> FileBody::read(char* dst, std::size_t len) {
        if (!file_) return Expected<std::size_t>::failure(ErrorKind::stream, "read on closed file");
        std::size_t n = std::fread(dst, 1, len, file_);
        if (n == 0 && std::ferror(file_)) {
            return Expected<std::size_t>::failure(ErrorKind::stream, std::string("read: ") + std::strerror(errno));
        }
        if (remaining_ >= 0) remaining_ -= static_cast<std::int64_t>(std::min<std::size_t>(n, static_cast<std::size_t>(remaining_)));
        return Expected<std::size_t>::success(n);
    }

    void FileBody::close() {
        if (file_) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }


    bool bodyEmpty(const BodyPtr& body) {
        return !body || body->length() == 0;
    }


    Expected<std::size_t> copyBody(IBodyReader& body, const WriteFn& write) {
        char buf[32 * 1024];
        std::size_t total = 0;
        for (;;) {
            auto r = body.read(buf, sizeof(buf));
            if (!r.has_value()) return Expected<std::size_t>::failure(*r.error);
            if (r.get() == 0) break;
            auto w = write(buf, r.get());
            if (!w.has_value()) return Expected<std::size_t>::failure(*w.error);
            total += r.get();
        }
        return Expected<std::size_t>::success(total);
    }


    Expected<std::size_t> drainBody(IBodyReader& body, std::ostream& sink) {
        auto res = copyBody(body, [&sink](const char* p, std::size_t n) {
            sink.write(p, static_cast<std::streamsize>(n));
            if (!sink) return Expected<void>::failure(ErrorKind::stream, "write to sink failed");
            return Expected<void>::success();
        });
        body.close();
        return res;
    }


    Expected<std::string> drainToString(IBodyReader& body) {
        std::ostringstream oss;
        auto res = drainBody(body, oss);
        if (!res.has_value()) return Expected<std::string>::failure(*res.error);
        return Expected<std::string>::success(oss.str());
    }


} // namespace ghttp
