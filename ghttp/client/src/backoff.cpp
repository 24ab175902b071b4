#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include "../include/backoff.hpp"


namespace ghttp {


    // uniform in [0, n); 0 when n <= 0
    static long long randBelow(long long n) {
        if (n <= 0) return 0;
        static thread_local std::mt19937_64 rng([]{
            std::random_device rd;
            std::seed_seq ss{rd(), rd(), rd(), rd()};
            return std::mt19937_64{ss};
        }());
        return std::uniform_int_distribution<long long>{0, n - 1}(rng);
    }


    std::chrono::nanoseconds ConstantBackoff::wait(int, const Response*, const Error*) const {
        if (!jitter_) return interval_;

        return interval_ / 2 + std::chrono::nanoseconds(randBelow(interval_.count()));
    }


    std::chrono::nanoseconds ExponentialBackoff::wait(int attemptNum, const Response*, const Error*) const {
        double temp = std::min(static_cast<double>(max_.count()),
                               static_cast<double>(base_.count()) * std::exp2(static_cast<double>(std::max(attemptNum, 0))));
        // LLONG_MAX rounds up to 2^63 as a double, so only max_ itself can reach it.
        if (temp >= static_cast<double>(std::numeric_limits<long long>::max())) {
            if (!jitter_) return max_;
            long long half = max_.count() / 2;
            return std::chrono::nanoseconds(half + randBelow(half));
        }
        if (!jitter_) return std::chrono::nanoseconds(static_cast<long long>(temp));

        long long half = static_cast<long long>(temp / 2);
        return std::chrono::nanoseconds(half + randBelow(half));
    }


    std::chrono::nanoseconds FibonacciBackoff::wait(int attemptNum, const Response*, const Error*) const {
        long long a = 0, b = 1;
        for (; attemptNum >= 0; --attemptNum) {
            if (maxValue_ > 0 && b >= maxValue_) {
                a = maxValue_;
                break;
            }
            if (b > std::numeric_limits<long long>::max() - a) { a = b; break; } // saturate
            long long next = a + b;
            a = b;
            b = next;
        }
        const auto unit = interval_.count();
        if (unit > 0 && a > std::chrono::nanoseconds::max().count() / unit) return std::chrono::nanoseconds::max();
        return interval_ * a;
    }


    BackoffPtr makeConstantBackoff(std::chrono::nanoseconds interval, bool jitter) {
        return std::make_shared<ConstantBackoff>(interval, jitter);
    }

    BackoffPtr makeExponentialBackoff(std::chrono::nanoseconds baseInterval, std::chrono::nanoseconds maxInterval, bool jitter) {
        return std::make_shared<ExponentialBackoff>(baseInterval, maxInterval, jitter);
    }

    BackoffPtr makeFibonacciBackoff(long long maxValue, std::chrono::nanoseconds interval) {
        return std::make_shared<FibonacciBackoff>(maxValue, interval);
    }


} // namespace ghttp
