#include <array>
#include <cctype>
#include "../include/sniff.hpp"


namespace ghttp {


    namespace {

        bool isWhitespace(unsigned char c) {
            return c == '\t' || c == '\n' || c == '\x0c' || c == '\r' || c == ' ';
        }

        bool isTagTerminator(unsigned char c) {
            return c == ' ' || c == '>';
        }

        // Binary control bytes never found in text.
        bool isBinary(unsigned char c) {
            return c <= 0x08 || c == 0x0b || (c >= 0x0e && c <= 0x1a) || (c >= 0x1c && c <= 0x1f);
        }

        bool startsWith(std::string_view data, std::string_view prefix) {
            return data.size() >= prefix.size() && data.compare(0, prefix.size(), prefix) == 0;
        }

        // Case-insensitive tag match after leading whitespace, followed by a tag terminator.
        bool matchHtml(std::string_view data, std::string_view tag) {
            std::size_t i = 0;
            while (i < data.size() && isWhitespace(static_cast<unsigned char>(data[i]))) ++i;
            data.remove_prefix(i);
            if (data.size() < tag.size() + 1) return false;
            for (std::size_t j = 0; j < tag.size(); ++j) {
                auto c = static_cast<unsigned char>(data[j]);
                if (std::toupper(c) != static_cast<unsigned char>(tag[j])) return false;
            }
            return isTagTerminator(static_cast<unsigned char>(data[tag.size()]));
        }

        struct Signature
        {
            std::string_view prefix;
            const char* mime;
        };

        using namespace std::string_view_literals;

        constexpr std::array kHtmlTags = {
            "<!DOCTYPE HTML"sv, "<HTML"sv, "<HEAD"sv, "<SCRIPT"sv, "<IFRAME"sv, "<H1"sv, "<DIV"sv,
            "<FONT"sv, "<TABLE"sv, "<A"sv, "<STYLE"sv, "<TITLE"sv, "<B"sv, "<BODY"sv, "<BR"sv, "<P"sv, "<!--"sv,
        };

        const std::array<Signature, 21> kExact = {{
            {"%PDF-"sv, "application/pdf"},
            {"%!PS-Adobe-"sv, "application/postscript"},
            {"\xFE\xFF"sv, "text/plain; charset=utf-16be"},
            {"\xFF\xFE"sv, "text/plain; charset=utf-16le"},
            {"\xEF\xBB\xBF"sv, "text/plain; charset=utf-8"},
            {"\x00\x00\x01\x00"sv, "image/x-icon"},
            {"\x00\x00\x02\x00"sv, "image/x-icon"},
            {"BM"sv, "image/bmp"},
            {"GIF87a"sv, "image/gif"},
            {"GIF89a"sv, "image/gif"},
            {"\x89PNG\x0D\x0A\x1A\x0A"sv, "image/png"},
            {"\xFF\xD8\xFF"sv, "image/jpeg"},
            {"OggS\x00"sv, "application/ogg"},
            {"MThd\x00\x00\x00\x06"sv, "audio/midi"},
            {"ID3"sv, "audio/mpeg"},
            {"\x1A\x45\xDF\xA3"sv, "video/webm"},
            {"Rar!\x1A\x07\x00"sv, "application/x-rar-compressed"},
            {"Rar!\x1A\x07\x01\x00"sv, "application/x-rar-compressed"},
            {"PK\x03\x04"sv, "application/zip"},
            {"\x1F\x8B\x08"sv, "application/x-gzip"},
            {"\x00\x61\x73\x6D"sv, "application/wasm"},
        }};

    } // namespace


    std::string detectContentType(std::string_view data) {
        if (data.size() > kSniffLen) data = data.substr(0, kSniffLen);

        for (auto tag : kHtmlTags) {
            if (matchHtml(data, tag)) return "text/html; charset=utf-8";
        }
        {
            std::size_t i = 0;
            while (i < data.size() && isWhitespace(static_cast<unsigned char>(data[i]))) ++i;
            if (startsWith(data.substr(i), "<?xml")) return "text/xml; charset=utf-8";
        }

        for (auto const& sig : kExact) {
            if (startsWith(data, sig.prefix)) return sig.mime;
        }

        // RIFF containers carry their format at offset 8.
        if (startsWith(data, "RIFF") && data.size() >= 12) {
            auto fourcc = data.substr(8, 4);
            if (fourcc == "WEBP") return "image/webp";
            if (fourcc == "WAVE") return "audio/wave";
            if (fourcc == "AVI ") return "video/avi";
        }
        if (startsWith(data, "FORM") && data.size() >= 12 && data.substr(8, 4) == "AIFF") return "audio/aiff";
        // ISO base media box: size(4) "ftyp" brand(4)
        if (data.size() >= 12 && data.substr(4, 4) == "ftyp") return "video/mp4";
        if (startsWith(data, "wOFF")) return "font/woff";
        if (startsWith(data, "wOF2")) return "font/woff2";
        if (startsWith(data, "OTTO")) return "font/otf";
        if (startsWith(data, std::string_view("\x00\x01\x00\x00", 4))) return "font/ttf";

        for (unsigned char c : data) {
            if (isBinary(c)) return "application/octet-stream";
        }
        return "text/plain; charset=utf-8";
    }


} // namespace ghttp
