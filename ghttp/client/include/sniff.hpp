#pragma once
#include <cstddef>
#include <string>
#include <string_view>


namespace ghttp {

    // Number of leading bytes detectContentType looks at.
    inline constexpr std::size_t kSniffLen = 512;

    /**
     * @brief Guesses a MIME type from the first bytes of a payload.
     *
     * Recognises common markup, image, audio, video, archive and font
     * signatures; falls back to "text/plain; charset=utf-8" for data without
     * binary control bytes and "application/octet-stream" otherwise.
     */
    std::string detectContentType(std::string_view data);

} // namespace ghttp
