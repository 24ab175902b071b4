#include <sstream>
#include <iomanip>
#include <cctype>
#include <algorithm>
#include "../include/types.hpp"
#include "../include/expected.hpp"


namespace ghttp {


    const char* toString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::preparation:      return "preparation";
            case ErrorKind::transport:        return "transport";
            case ErrorKind::stream:           return "stream";
            case ErrorKind::canceled:         return "canceled";
            case ErrorKind::deadlineExceeded: return "deadline exceeded";
        }
        return "unknown";
    }


    bool equalsIgnoreCase(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
        }
        return true;
    }


    void HeaderMap::set(const std::string& name, const std::string& value) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e){ return equalsIgnoreCase(e.first, name); });
        if (it == entries_.end()) {
            entries_.emplace_back(name, value);
            return;
        }
        it->second = value;
        // drop any further values for the same name
        auto tail = std::remove_if(std::next(it), entries_.end(),
                                   [&](const Entry& e){ return equalsIgnoreCase(e.first, name); });
        entries_.erase(tail, entries_.end());
    }

    void HeaderMap::append(const std::string& name, const std::string& value) {
        entries_.emplace_back(name, value);
    }

    std::optional<std::string> HeaderMap::get(std::string_view name) const {
        for (auto const& e : entries_) if (equalsIgnoreCase(e.first, name)) return e.second;
        return std::nullopt;
    }

    std::vector<std::string> HeaderMap::getAll(std::string_view name) const {
        std::vector<std::string> out;
        for (auto const& e : entries_) if (equalsIgnoreCase(e.first, name)) out.push_back(e.second);
        return out;
    }

    bool HeaderMap::has(std::string_view name) const {
        return get(name).has_value();
    }

    void HeaderMap::remove(std::string_view name) {
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                      [&](const Entry& e){ return equalsIgnoreCase(e.first, name); }),
                       entries_.end());
    }


    std::string queryEscape(std::string_view raw)
    {
        std::ostringstream oss;
        for (unsigned char c : raw) {
            if ((c>='A'&&c<='Z')||(c>='a'&&c<='z')||(c>='0'&&c<='9')||c=='-'||c=='_'||c=='.'||c=='~') oss<<c;
            else if (c==' ') oss<<'+';
            else {
                oss<<'%'<<std::uppercase<<std::hex<<std::setw(2)<<std::setfill('0')<<(int)c<<std::nouppercase<<std::dec;
            }
        }
        return oss.str();
    }


    std::string encodeParams(const Params& params) {
        Params sorted = params;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const auto& a, const auto& b){ return a.first < b.first; });

        std::ostringstream out;
        bool first = true;
        for (auto const& [k, v] : sorted) {
            if (!first) out << '&';
            first = false;
            out << queryEscape(k) << '=' << queryEscape(v);
        }
        return out.str();
    }


} // namespace ghttp
