#include "auth/rate_limiter.hpp"

namespace
{
    constexpr size_t PURGE_EVERY = 1024;
}

RateLimiter::RateLimiter(Clock clock) : clock_(std::move(clock))
{
}

bool RateLimiter::hit(const std::string &key, const RateWindow &window)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    purgeExpired(now);

    Bucket &bucket = current(bucketKey(key, window), window, now);
    ++bucket.count;
    return bucket.count <= window.limit;
}

bool RateLimiter::hitAll(const std::string &key, const std::vector<RateWindow> &windows)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    purgeExpired(now);

    std::vector<Bucket *> buckets;
    buckets.reserve(windows.size());
    for (const auto &window : windows)
    {
        Bucket &bucket = current(bucketKey(key, window), window, now);
        if (bucket.count >= window.limit)
            return false;
        buckets.push_back(&bucket);
    }
    for (Bucket *bucket : buckets)
        ++bucket->count;
    return true;
}

int RateLimiter::count(const std::string &key, const RateWindow &window) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucketKey(key, window));
    if (it == buckets_.end() || clock_() - it->second.opened >= window.period)
        return 0;
    return it->second.count;
}

void RateLimiter::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.clear();
}

std::string RateLimiter::bucketKey(const std::string &key, const RateWindow &window)
{
    return std::to_string(window.limit) + "/" + std::to_string(window.period.count()) + "s:" + key;
}

RateLimiter::Bucket &RateLimiter::current(const std::string &bucket_key, const RateWindow &window,
                                          std::chrono::steady_clock::time_point now)
{
    auto it = buckets_.find(bucket_key);
    if (it == buckets_.end() || now - it->second.opened >= window.period)
    {
        Bucket &bucket = buckets_[bucket_key];
        bucket.opened = now;
        bucket.period = window.period;
        bucket.count = 0;
        return bucket;
    }
    return it->second;
}

void RateLimiter::purgeExpired(std::chrono::steady_clock::time_point now)
{
    if (++hits_since_purge_ < PURGE_EVERY)
        return;
    hits_since_purge_ = 0;

    for (auto it = buckets_.begin(); it != buckets_.end();)
    {
        if (now - it->second.opened >= it->second.period)
            it = buckets_.erase(it);
        else
            ++it;
    }
}
