#pragma once
#include <memory>
#include "request.hpp"
#include "response.hpp"
#include "expected.hpp"


namespace ghttp {


    struct IBeforeRequestCallback
    {
        virtual ~IBeforeRequestCallback() = default;
        // Called before any network activity; an error aborts the request.
        virtual Expected<void> enter(Request& req) = 0;
    };


    struct IAfterResponseCallback
    {
        virtual ~IAfterResponseCallback() = default;
        // Called once per request with the final outcome; resp may be null.
        virtual void exit(Response* resp, const Error* err) = 0;
    };


    // Function variant of IBeforeRequestCallback.
    class HookCallback : public IBeforeRequestCallback
    {
    public:
        explicit HookCallback(RequestHook hook) : hook_(std::move(hook)) {}
        Expected<void> enter(Request& req) override {
            return hook_ ? hook_(req) : Expected<void>::success();
        }
    private:
        RequestHook hook_;
    };


} // namespace ghttp
