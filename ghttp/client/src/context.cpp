#include "../include/context.hpp"


namespace ghttp {


    Error canceledError() { return Error{ErrorKind::canceled, "context canceled"}; }

    Error deadlineExceededError() { return Error{ErrorKind::deadlineExceeded, "context deadline exceeded"}; }


    std::shared_ptr<Context> Context::background() {
        return std::make_shared<Context>();
    }

    std::shared_ptr<Context> Context::withCancel() {
        return std::make_shared<Context>();
    }

    std::shared_ptr<Context> Context::withDeadline(Clock::time_point deadline) {
        auto ctx = std::make_shared<Context>();
        ctx->deadline_ = deadline;
        return ctx;
    }

    std::shared_ptr<Context> Context::withTimeout(Clock::duration timeout) {
        return withDeadline(Clock::now() + timeout);
    }


    void Context::cancel() {
        {
            std::scoped_lock lk(mu_);
            if (cancelled_) return;
            cancelled_ = true;
        }
        cv_.notify_all();

        // Listeners run one at a time outside the lock; firing_ names the running one.
        for (;;) {
            std::function<void()> fn;
            {
                std::scoped_lock lk(mu_);
                if (listeners_.empty()) break;
                auto it = listeners_.begin();
                firing_ = it->first;
                fn = std::move(it->second);
                listeners_.erase(it);
            }
            if (fn) fn();
            {
                std::scoped_lock lk(mu_);
                firing_ = 0;
            }
            cv_.notify_all();
        }
    }


    std::optional<Error> Context::err() const {
        {
            std::scoped_lock lk(mu_);
            if (cancelled_) return canceledError();
        }
        if (deadline_ && Clock::now() >= *deadline_) return deadlineExceededError();
        return std::nullopt;
    }


    Expected<void> Context::waitFor(Clock::duration d) {
        auto until = Clock::now() + d;
        bool hitDeadline = false;
        if (deadline_ && *deadline_ <= until) {
            until = *deadline_;
            hitDeadline = true;
        }

        std::unique_lock lk(mu_);
        if (cv_.wait_until(lk, until, [this]{ return cancelled_; })) {
            return Expected<void>::failure(canceledError());
        }
        if (hitDeadline) return Expected<void>::failure(deadlineExceededError());
        return Expected<void>::success();
    }


    Context::ListenerId Context::addListener(std::function<void()> fn) {
        {
            std::scoped_lock lk(mu_);
            if (!cancelled_) {
                auto id = nextId_++;
                listeners_.emplace(id, std::move(fn));
                return id;
            }
        }
        // Already cancelled: run right away so the caller never misses the wake-up.
        fn();
        return 0;
    }


    void Context::removeListener(ListenerId id) {
        std::unique_lock lk(mu_);
        listeners_.erase(id);
        if (id != 0) cv_.wait(lk, [this, id]{ return firing_ != id; });
    }


} // namespace ghttp
