#pragma once

#include "types.hpp"
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <string>

namespace ferry
{
    /**
     * Thread-safe token-bucket rate limiter keyed by caller (identity hex or
     * remote address). Defaults: 60 requests per minute per key.
     */
    class RateLimiter
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;

        struct Config
        {
            double tokens_per_second{1.0}; // 60 per minute
            double burst_capacity{60.0};   // allow short bursts
        };

        RateLimiter();
        explicit RateLimiter(const Config &cfg);

        /** Returns true if a token is available for the given key. */
        bool allow(const std::string &key);

        /** Same, at an explicit instant */
        bool allow(const std::string &key, TimePoint now);

    private:
        struct Bucket
        {
            double tokens{0.0};
            TimePoint last_refill{};
            bool primed{false};
        };

        void refill(Bucket &bucket, TimePoint now);

        Config cfg_;
        std::unordered_map<std::string, Bucket> buckets_;
        std::mutex mutex_;
    };
}
