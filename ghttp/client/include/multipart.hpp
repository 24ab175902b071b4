#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "body.hpp"
#include "pipe.hpp"
#include "request.hpp"
#include "types.hpp"
#include "../../logger/logger.hpp"


namespace ghttp {


    // One file section of a multipart payload.
    class File
    {
    public:
        static std::shared_ptr<File> fromReader(BodyPtr body);
        // The filename defaults to the last path component.
        static Expected<std::shared_ptr<File>> open(const std::string& path);
        // Like open(), throws std::runtime_error on failure.
        static std::shared_ptr<File> mustOpen(const std::string& path);

        File& withFilename(std::string filename) { filename_ = std::move(filename); return *this; }
        File& withMime(std::string mime) { mime_ = std::move(mime); return *this; }

        const std::string& filename() const noexcept { return filename_; }
        const std::string& mime() const noexcept { return mime_; }

        Expected<std::size_t> read(char* dst, std::size_t len);
        // Safe to call more than once; only the first call closes the body.
        void close();
        bool closed() const noexcept { return closed_; }

    private:
        explicit File(BodyPtr body) : body_(std::move(body)) {}

        BodyPtr body_;
        std::string filename_;
        std::string mime_;
        bool closed_{false};
    };

    // Ordered (field name, file) entries.
    using Files = std::vector<std::pair<std::string, std::shared_ptr<File>>>;


    /**
     * @brief Streaming multipart/form-data body.
     *
     * The payload is produced on a background thread started by the first
     * read() and handed over through a bounded pipe, so file contents are
     * never held in memory as a whole. The producer writes every file
     * section, then every form field, then the closing boundary.
     *
     * A FormData is not replayable; Retrier::prepare captures it when retries
     * are enabled.
     */
    class FormData : public IBodyReader
    {
    public:
        explicit FormData(Files files, Form form = {});
        ~FormData() override;

        FormData(const FormData&) = delete;
        FormData& operator=(const FormData&) = delete;

        FormData& withForm(Form form) { form_ = std::move(form); return *this; }
        void setLogger(std::shared_ptr<logger::Logger> lg) { logger_ = std::move(lg); }

        const std::string& boundary() const noexcept { return boundary_; }
        std::string contentType() const { return "multipart/form-data; boundary=" + boundary_; }

        Expected<std::size_t> read(char* dst, std::size_t len) override;
        void close() override;

    private:
        void produce();
        Expected<void> writePartHeader(const std::vector<std::pair<std::string, std::string>>& headers);
        Expected<void> writeFile(const std::string& key, File& file);
        void closeFiles();

        Files files_;
        Form form_;
        std::string boundary_;
        bool wrotePart_{false};

        BytePipe pipe_;
        std::once_flag started_;
        std::thread producer_;
        std::shared_ptr<logger::Logger> logger_;
    };


    // Generates a random boundary of 60 hex characters.
    std::string randomBoundary();

    // Escapes backslashes and double quotes for a quoted header parameter.
    std::string escapeQuotes(std::string_view s);

    RequestHook withFiles(Files files, Form form = {});


} // namespace ghttp
