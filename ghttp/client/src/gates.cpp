#include <algorithm>
#include <cmath>
#include "../include/gates.hpp"


namespace ghttp {


    RateLimiter::RateLimiter(double tokensPerSecond, int burst)
        : rate_(tokensPerSecond), burst_(std::max(burst, 1)), tokens_(static_cast<double>(std::max(burst, 1))), last_(Clock::now()) {}


    void RateLimiter::refillLocked(Clock::time_point now) {
        if (now <= last_) return;
        if (rate_ > 0) {
            std::chrono::duration<double> elapsed = now - last_;
            tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed.count() * rate_);
        }
        last_ = now;
    }


    bool RateLimiter::allow() {
        std::scoped_lock lk(mu_);
        refillLocked(Clock::now());
        if (tokens_ < 1.0) return false;
        tokens_ -= 1.0;
        return true;
    }


    double RateLimiter::tokens() {
        std::scoped_lock lk(mu_);
        refillLocked(Clock::now());
        return tokens_;
    }


    Expected<void> RateLimiter::wait(Context& ctx) {
        if (auto e = ctx.err()) return Expected<void>::failure(*e);

        // Wake up on cancel(); deadline expiry is bounded by wait_until below.
        auto listener = ctx.addListener([this]{
            std::scoped_lock lk(mu_);
            cv_.notify_all();
        });

        Expected<void> result = Expected<void>::success();
        {
            std::unique_lock lk(mu_);
            for (;;) {
                if (auto e = ctx.err()) {
                    result = Expected<void>::failure(*e);
                    break;
                }

                auto now = Clock::now();
                refillLocked(now);
                if (tokens_ >= 1.0) {
                    tokens_ -= 1.0;
                    break;
                }
                if (rate_ <= 0) {
                    result = Expected<void>::failure(ErrorKind::preparation, "rate: wait(n=1) exceeds limiter's burst");
                    break;
                }

                auto need = std::chrono::duration<double>((1.0 - tokens_) / rate_);
                auto ready = now + std::chrono::duration_cast<Clock::duration>(need);
                if (auto dl = ctx.deadline(); dl && *dl < ready) {
                    result = Expected<void>::failure(ErrorKind::deadlineExceeded, "rate: wait(n=1) would exceed context deadline");
                    break;
                }
                cv_.wait_until(lk, ready);
            }
        }

        ctx.removeListener(listener);
        return result;
    }


    Expected<void> RateGate::enter(Request& req) {
        return limiter_->wait(*req.context());
    }


    Expected<void> ConcurrencyGate::acquire(Context& ctx) {
        if (capacity_ == 0) return Expected<void>::failure(ErrorKind::preparation, "concurrency gate has no capacity");

        // Registered before taking mu_: a context that is already cancelled runs the listener inline.
        auto listener = ctx.addListener([this]{
            std::scoped_lock lk(mu_);
            cv_.notify_all();
        });

        Expected<void> result = Expected<void>::success();
        {
            std::unique_lock lk(mu_);
            for (;;) {
                if (inUse_ < capacity_) {
                    ++inUse_;
                    break;
                }
                if (auto e = ctx.err()) {
                    result = Expected<void>::failure(*e);
                    break;
                }
                if (auto dl = ctx.deadline()) cv_.wait_until(lk, *dl);
                else cv_.wait(lk);
            }
        }

        ctx.removeListener(listener);
        return result;
    }


    void ConcurrencyGate::release() {
        {
            std::scoped_lock lk(mu_);
            if (inUse_ > 0) --inUse_;
        }
        cv_.notify_all();
    }


    std::size_t ConcurrencyGate::inUse() {
        std::scoped_lock lk(mu_);
        return inUse_;
    }


    Expected<void> ConcurrencyGate::enter(Request& req) {
        return acquire(*req.context());
    }


    void ConcurrencyGate::exit(Response*, const Error*) {
        release();
    }


} // namespace ghttp
