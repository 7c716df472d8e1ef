#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace sentinel
{
    /**
     * Thread-safe fixed-window request counter keyed by service name or
     * "agent:<name>". Each key owns one bucket (count + window start);
     * buckets are created on first use and live for the process lifetime,
     * so the table is bounded by the number of configured services and agents.
     *
     * The window is fixed, not sliding: a burst straddling a window boundary
     * can admit up to 2 x limit requests in a short span.
     */
    class RateWindow
    {
    public:
        using Clock = std::function<std::chrono::steady_clock::time_point()>;

        static constexpr std::chrono::milliseconds kWindow{60000};

        RateWindow();
        explicit RateWindow(Clock clock);

        /**
         * Returns true if the request fits in the key's current window and
         * counts it. A missing or non-positive limit always allows without
         * creating state. A denied request does not increment the counter.
         */
        bool allow(const std::string &key, std::optional<std::int64_t> limit_per_minute);

        /** Number of buckets created so far. */
        std::size_t bucket_count() const;

    private:
        struct Bucket
        {
            std::mutex mutex;
            std::int64_t count{0};
            std::chrono::steady_clock::time_point window_start{};
            bool started{false};
        };

        Bucket &bucket_for(const std::string &key);

        Clock clock_;
        mutable std::shared_mutex table_mutex_;
        std::unordered_map<std::string, std::unique_ptr<Bucket>> buckets_;
    };
}
