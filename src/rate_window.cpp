#include "sentinel/rate_window.hpp"

namespace sentinel
{
    RateWindow::RateWindow() : clock_([] { return std::chrono::steady_clock::now(); }) {}

    RateWindow::RateWindow(Clock clock) : clock_(std::move(clock)) {}

    RateWindow::Bucket &RateWindow::bucket_for(const std::string &key)
    {
        {
            std::shared_lock read_lock(table_mutex_);
            if (auto it = buckets_.find(key); it != buckets_.end())
                return *it->second;
        }

        std::unique_lock write_lock(table_mutex_);
        auto &slot = buckets_[key];
        if (!slot)
            slot = std::make_unique<Bucket>();
        return *slot;
    }

    bool RateWindow::allow(const std::string &key, std::optional<std::int64_t> limit_per_minute)
    {
        if (!limit_per_minute || *limit_per_minute <= 0)
            return true;

        auto &bucket = bucket_for(key);
        std::lock_guard lock(bucket.mutex);
        auto now = clock_();

        if (!bucket.started || now - bucket.window_start >= kWindow)
        {
            bucket.started = true;
            bucket.window_start = now;
            bucket.count = 1;
            return true;
        }

        if (bucket.count >= *limit_per_minute)
            return false;

        ++bucket.count;
        return true;
    }

    std::size_t RateWindow::bucket_count() const
    {
        std::shared_lock lock(table_mutex_);
        return buckets_.size();
    }

} // namespace sentinel
