#pragma once
#include <mutex>
#include <ostream>
#include "callbacks.hpp"


namespace ghttp {


    /**
     * @brief Dumps request and response traffic to a stream, like "curl -v".
     *
     * With body dumping on, the request body is captured into memory and put
     * back as a replayable body; the response body is likewise buffered and
     * handed back to the caller unread.
     */
    class Debugger : public IBeforeRequestCallback, public IAfterResponseCallback
    {
    public:
        Debugger(std::ostream& out, bool body) : out_(out), body_(body) {}

        Expected<void> enter(Request& req) override;
        void exit(Response* resp, const Error* err) override;

    private:
        Expected<void> dumpRequest(Request& req);
        Expected<void> dumpResponse(Response& resp);
        void dumpError(const Error& err);

        std::mutex mu_;
        std::ostream& out_;
        bool body_;
    };


} // namespace ghttp
