#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief One fixed-window limit, e.g. 20 per minute
 */
struct RateWindow
{
    int limit;
    std::chrono::seconds period;
};

/**
 * @brief Thread-safe, process-local fixed-window counters
 *
 * A window opens on the first hit of a key and lasts for its period; the
 * counter starts over once the window has elapsed.
 */
class RateLimiter
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit RateLimiter(Clock clock = []()
                         { return std::chrono::steady_clock::now(); });

    /**
     * @brief Count one event for key in the given window
     * @return true while the count is still within the limit
     */
    bool hit(const std::string &key, const RateWindow &window);

    /**
     * @brief Consume one event in every window, but only if all of them have room
     * @return false (and nothing consumed) if any window is exhausted
     */
    bool hitAll(const std::string &key, const std::vector<RateWindow> &windows);

    // Events counted for key in the window's current period; never opens or resets a window
    int count(const std::string &key, const RateWindow &window) const;

    void clear();

private:
    struct Bucket
    {
        std::chrono::steady_clock::time_point opened;
        std::chrono::seconds period{0};
        int count = 0;
    };

    static std::string bucketKey(const std::string &key, const RateWindow &window);
    Bucket &current(const std::string &bucket_key, const RateWindow &window, std::chrono::steady_clock::time_point now);
    void purgeExpired(std::chrono::steady_clock::time_point now);

    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
    size_t hits_since_purge_ = 0;
};
