#pragma once
#include "metaquorum/core/Error.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace MQ::MetaCache {

struct ValueCacheOptions {
    // A failed refresh keeps serving the previous value instead of failing.
    bool returnLastGood = false;
    // Between one and two TTLs the stale value is returned at once and refreshed in the background.
    bool noWait = false;
};

/*
 * Holds the result of an expensive lookup for a fixed time. Refreshes are serialised: callers
 * that find an expired value wait for a single update instead of each running their own.
 * The clock is injectable so tests can move time.
 */
template <typename T>
class ValueCache {
public:
    using Clock    = std::chrono::steady_clock;
    using UpdateFn = std::function<Expected<T>()>;
    using NowFn    = std::function<Clock::time_point()>;

    ValueCache(UpdateFn update, Clock::duration ttl, ValueCacheOptions options = {}, NowFn now = &Clock::now)
        : update_(std::move(update)), ttl_(ttl), options_(options), now_(std::move(now)) {}

    ~ValueCache() {
        std::lock_guard<std::mutex> lock(this->refresherMutex_);
        if (this->refresher_.joinable()) {
            this->refresher_.join();
        }
    }

    ValueCache(ValueCache const&)            = delete;
    ValueCache& operator=(ValueCache const&) = delete;

    auto get() -> Expected<T> {
        auto current = this->snapshot(this->now_());
        if (current.value && current.age < this->ttl_) {
            return *std::move(current.value);
        }
        if (this->options_.noWait && current.value && current.age < 2 * this->ttl_) {
            this->refreshInBackground();
            return *std::move(current.value);
        }

        std::lock_guard<std::mutex> lock(this->updateMutex_);
        auto again = this->snapshot(this->now_());
        if (again.value && again.age < this->ttl_) {
            return *std::move(again.value);
        }
        return this->updateLocked();
    }

    // Runs the update function now, waiting for any refresh already in progress.
    auto update() -> Expected<void> {
        std::lock_guard<std::mutex> lock(this->updateMutex_);
        auto updated = this->updateLocked();
        if (!updated) {
            return std::unexpected(updated.error());
        }
        return {};
    }

    // Failure of the most recent background refresh, cleared by the next successful update.
    [[nodiscard]] auto lastRefreshError() const -> std::optional<Error> {
        std::lock_guard<std::mutex> lock(this->valueMutex_);
        return this->refreshError_;
    }

private:
    struct Snapshot {
        std::optional<T> value;
        Clock::duration  age{};
    };

    auto snapshot(Clock::time_point now) const -> Snapshot {
        std::lock_guard<std::mutex> lock(this->valueMutex_);
        Snapshot                    result;
        if (this->value_) {
            result.value = this->value_;
            result.age   = now - this->updatedAt_;
        }
        return result;
    }

    // Caller holds updateMutex_.
    auto updateLocked() -> Expected<T> {
        auto fresh = this->update_();
        std::lock_guard<std::mutex> lock(this->valueMutex_);
        if (!fresh) {
            if (this->options_.returnLastGood && this->value_) {
                return *this->value_;
            }
            return std::unexpected(fresh.error());
        }
        this->value_     = *fresh;
        this->updatedAt_ = this->now_();
        this->refreshError_.reset();
        return *std::move(fresh);
    }

    auto refreshInBackground() -> void {
        bool idle = false;
        if (!this->refreshing_.compare_exchange_strong(idle, true)) {
            return;
        }
        std::lock_guard<std::mutex> lock(this->refresherMutex_);
        if (this->refresher_.joinable()) {
            this->refresher_.join();
        }
        this->refresher_ = std::thread([this] {
            {
                std::lock_guard<std::mutex> updating(this->updateMutex_);
                auto                        fresh = this->update_();
                std::lock_guard<std::mutex> guard(this->valueMutex_);
                if (fresh) {
                    this->value_     = *std::move(fresh);
                    this->updatedAt_ = this->now_();
                    this->refreshError_.reset();
                } else {
                    this->refreshError_ = fresh.error();
                }
            }
            this->refreshing_.store(false);
        });
    }

    UpdateFn          update_;
    Clock::duration   ttl_;
    ValueCacheOptions options_;
    NowFn             now_;

    std::mutex           updateMutex_;
    mutable std::mutex   valueMutex_;
    std::optional<T>     value_;
    Clock::time_point    updatedAt_{};
    std::optional<Error> refreshError_;

    std::atomic<bool> refreshing_{false};
    std::mutex        refresherMutex_;
    std::thread       refresher_;
};

} // namespace MQ::MetaCache
