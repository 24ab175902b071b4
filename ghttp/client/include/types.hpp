#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <vector>


namespace ghttp {


    namespace method {
        inline constexpr const char* get     = "GET";
        inline constexpr const char* head    = "HEAD";
        inline constexpr const char* post    = "POST";
        inline constexpr const char* put     = "PUT";
        inline constexpr const char* patch   = "PATCH";
        inline constexpr const char* del     = "DELETE";
        inline constexpr const char* options = "OPTIONS";
        inline constexpr const char* connect = "CONNECT";
        inline constexpr const char* trace   = "TRACE";
    }

    inline constexpr int kStatusOK = 200;
    inline constexpr int kStatusTooManyRequests = 429;


    // Ordered key/value pairs; keys may repeat. Used for query parameters and form fields.
    using Params = std::vector<std::pair<std::string, std::string>>;
    using Form = Params;


    /**
     * @brief Case-insensitive multi-valued header collection.
     *
     * Keeps insertion order and the spelling of the first insertion of a name,
     * so dumps render headers the way the caller wrote them.
     */
    class HeaderMap
    {
    public:
        using Entry = std::pair<std::string, std::string>;
        using iterator = std::vector<Entry>::const_iterator;

        void set(const std::string& name, const std::string& value);
        void append(const std::string& name, const std::string& value);
        std::optional<std::string> get(std::string_view name) const;
        std::vector<std::string> getAll(std::string_view name) const;
        bool has(std::string_view name) const;
        void remove(std::string_view name);
        std::size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }
        void clear() { entries_.clear(); }

        iterator begin() const { return entries_.begin(); }
        iterator end() const { return entries_.end(); }

    private:
        std::vector<Entry> entries_;
    };

    bool equalsIgnoreCase(std::string_view a, std::string_view b);

    // Percent-encodes per application/x-www-form-urlencoded (space becomes '+').
    std::string queryEscape(std::string_view raw);

    // Encodes pairs sorted by key (stable for repeated keys) as k=v&k=v.
    std::string encodeParams(const Params& params);


} // namespace ghttp
