#include <fstream>
#include "../include/response.hpp"


namespace ghttp {


    Expected<std::string> Response::content() {
        if (!body) return Expected<std::string>::success(std::string{});
        return drainToString(*body);
    }


    Expected<void> Response::saveFile(const std::string& path) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) return Expected<void>::failure(ErrorKind::stream, "open " + path + " for writing failed");
        if (!body) return Expected<void>::success();

        auto res = drainBody(*body, out);
        if (!res.has_value()) return Expected<void>::failure(*res.error);
        return Expected<void>::success();
    }


    void Response::close() {
        if (body) body->close();
    }


    std::optional<TraceInfo> Response::traceInfo() const {
        if (!clientTrace) return std::nullopt;
        return clientTrace->info();
    }


} // namespace ghttp
