#include <array>
#include <cstdio>
#include <stdexcept>
#include <openssl/rand.h>
#include "../include/multipart.hpp"
#include "../include/sniff.hpp"


namespace ghttp {


    // ---- File ----

    std::shared_ptr<File> File::fromReader(BodyPtr body) {
        return std::shared_ptr<File>(new File(std::move(body)));
    }


    Expected<std::shared_ptr<File>> File::open(const std::string& path) {
        auto body = FileBody::open(path);
        if (!body.has_value()) return Expected<std::shared_ptr<File>>::failure(*body.error);

        auto f = fromReader(std::move(body.get()));
        auto slash = path.find_last_of('/');
        f->withFilename(slash == std::string::npos ? path : path.substr(slash + 1));
        return Expected<std::shared_ptr<File>>::success(std::move(f));
    }


    std::shared_ptr<File> File::mustOpen(const std::string& path) {
        auto f = open(path);
        if (!f.has_value()) throw std::runtime_error(f.error->message);
        return std::move(f.get());
    }


    Expected<std::size_t> File::read(char* dst, std::size_t len) {
        if (closed_) return Expected<std::size_t>::failure(ErrorKind::stream, "read on closed file");
        if (!body_) return Expected<std::size_t>::success(0);
        return body_->read(dst, len);
    }


    void File::close() {
        if (closed_) return;
        closed_ = true;
        if (body_) body_->close();
    }


    // ---- helpers ----

    std::string randomBoundary() {
        std::array<unsigned char, 30> raw{};
        if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
            throw std::runtime_error("multipart: RAND_bytes failed");
        }
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(raw.size() * 2);
        for (unsigned char b : raw) {
            out.push_back(kHex[b >> 4]);
            out.push_back(kHex[b & 0x0f]);
        }
        return out;
    }


    std::string escapeQuotes(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c == '\\' || c == '"') out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }


    // ---- FormData ----

    FormData::FormData(Files files, Form form)
        : files_(std::move(files)), form_(std::move(form)), boundary_(randomBoundary()),
          logger_(std::make_shared<logger::Logger>()) {}


    FormData::~FormData() {
        close();
        if (producer_.joinable()) producer_.join();
    }


    Expected<std::size_t> FormData::read(char* dst, std::size_t len) {
        std::call_once(started_, [this]{ producer_ = std::thread(&FormData::produce, this); });
        return pipe_.read(dst, len);
    }


    void FormData::close() {
        // Never started: nobody else will release the files.
        std::call_once(started_, [this]{
            closeFiles();
            pipe_.closeWrite();
        });
        pipe_.closeRead();
    }


    void FormData::closeFiles() {
        for (auto& [key, file] : files_) {
            if (file) file->close();
        }
    }


    Expected<void> FormData::writePartHeader(const std::vector<std::pair<std::string, std::string>>& headers) {
        std::string h = wrotePart_ ? "\r\n--" + boundary_ + "\r\n" : "--" + boundary_ + "\r\n";
        wrotePart_ = true;
        for (auto const& [k, v] : headers) {
            h += k + ": " + v + "\r\n";
        }
        h += "\r\n";
        return pipe_.write(h.data(), h.size());
    }


    Expected<void> FormData::writeFile(const std::string& key, File& file) {
        const std::string filename = file.filename().empty() ? "???" : file.filename();

        // Peek up to kSniffLen bytes so the content type can be guessed before the header goes out.
        std::string head;
        head.resize(kSniffLen);
        std::size_t got = 0;
        bool eof = false;
        while (got < kSniffLen) {
            auto r = file.read(head.data() + got, kSniffLen - got);
            if (!r.has_value()) return Expected<void>::failure(*r.error);
            if (r.get() == 0) { eof = true; break; }
            got += r.get();
        }
        head.resize(got);

        std::string mime = file.mime().empty() ? detectContentType(head) : file.mime();

        auto w = writePartHeader({
            {"Content-Disposition", "form-data; name=\"" + escapeQuotes(key) + "\"; filename=\"" + escapeQuotes(filename) + "\""},
            {"Content-Type", mime},
        });
        if (!w.has_value()) return w;
        if (!head.empty()) {
            w = pipe_.write(head.data(), head.size());
            if (!w.has_value()) return w;
        }
        if (eof) return Expected<void>::success();

        char buf[32 * 1024];
        for (;;) {
            auto r = file.read(buf, sizeof(buf));
            if (!r.has_value()) return Expected<void>::failure(*r.error);
            if (r.get() == 0) break;
            w = pipe_.write(buf, r.get());
            if (!w.has_value()) return w;
        }
        return Expected<void>::success();
    }


    void FormData::produce() {
        for (auto& [key, file] : files_) {
            if (!file) continue;
            auto res = writeFile(key, *file);
            if (!res.has_value()) {
                const std::string filename = file->filename().empty() ? "???" : file->filename();
                GHTTP_LOG(logger_, logger::LogLevel::warn, "multipart")
                    << "can't bind multipart section (" << key << "=@" << filename << "): " << res.error->message;
            }
            file->close();
        }

        for (auto const& [k, v] : form_) {
            auto w = writePartHeader({{"Content-Disposition", "form-data; name=\"" + escapeQuotes(k) + "\""}});
            if (w.has_value()) w = pipe_.write(v.data(), v.size());
            if (!w.has_value()) break;
        }

        const std::string closing = "\r\n--" + boundary_ + "--\r\n";
        auto w = pipe_.write(closing.data(), closing.size());
        pipe_.closeWrite(w.error);
    }


    RequestHook withFiles(Files files, Form form) {
        return [files = std::move(files), form = std::move(form)](Request& req) {
            req.setFiles(std::make_unique<FormData>(files, form));
            return Expected<void>::success();
        };
    }


} // namespace ghttp
