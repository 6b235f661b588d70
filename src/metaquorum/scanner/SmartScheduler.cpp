#include "metaquorum/scanner/SmartScheduler.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace MQ::Scanner {

using namespace std::chrono_literals;

SmartScheduler::SmartScheduler(ScannerPerfConfig config, LoadSource const& load)
    : config_(config), load_(load) {
    this->state_.currentMode = config.mode;
}

auto SmartScheduler::shouldScan(Clock::time_point now) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto&                       state = this->state_;

    if (this->config_.mode == ScannerMode::Disabled) {
        return false;
    }

    if (state.pauseUntil) {
        if (now < *state.pauseUntil) {
            return false;
        }
        state.pauseUntil.reset();
    }

    if (state.lastScanTime && now - *state.lastScanTime < this->config_.minScanInterval) {
        return false;
    }

    auto const status = this->load_.loadStatus();
    switch (this->config_.mode) {
    case ScannerMode::Disabled:
        return false;
    case ScannerMode::LowLoadOnly:
        if (status == LoadStatus::Idle || status == LoadStatus::Low) {
            ++state.lowLoadCount;
            state.highLoadCount = 0;
            if (state.lowLoadCount >= kLowLoadScansAfter) {
                mq_log("low load detected, scan allowed", "SmartScheduler");
                return true;
            }
            return false;
        }
        ++state.highLoadCount;
        state.lowLoadCount = 0;
        if (state.highLoadCount >= kHighLoadPauseAfter) {
            state.pauseUntil = now + this->config_.pauseDuration;
            mq_log("high load (" + std::to_string(this->load_.currentIops()) + " iops), pausing for "
                       + std::to_string(this->config_.pauseDuration.count()) + "ms",
                   "SmartScheduler");
        }
        return false;
    case ScannerMode::Normal:
        if (status == LoadStatus::Overload) {
            ++state.highLoadCount;
            if (state.highLoadCount >= kOverloadPauseAfter) {
                state.pauseUntil = now + kOverloadPause;
                mq_log("overloaded, pausing scanner", "SmartScheduler");
            }
            return false;
        }
        state.highLoadCount = 0;
        return true;
    case ScannerMode::Aggressive:
        return true;
    }
    return false;
}

auto SmartScheduler::recordScanStart(Clock::time_point now) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->state_.lastScanTime = now;
}

auto SmartScheduler::adaptiveAdjust() -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto&                       config = this->config_;
    if (!config.smartScheduling) {
        return;
    }

    switch (this->load_.loadStatus()) {
    case LoadStatus::Idle:
        config.batchSize     = std::min(config.batchSize * 2, kMaxBatchSize);
        config.batchInterval = 50ms;
        break;
    case LoadStatus::Low:
        config.batchSize     = 100;
        config.batchInterval = 100ms;
        break;
    case LoadStatus::Medium:
        config.batchSize     = std::max(config.batchSize / 2, kMinMediumBatchSize);
        config.batchInterval = 200ms;
        break;
    case LoadStatus::High:
    case LoadStatus::Overload:
        config.batchSize     = 10;
        config.batchInterval = 500ms;
        mq_log("high load, minimizing scan batch", "SmartScheduler");
        break;
    }
}

auto SmartScheduler::batchSize() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->config_.batchSize;
}

auto SmartScheduler::batchInterval() const -> std::chrono::milliseconds {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->config_.batchInterval;
}

auto SmartScheduler::shouldSkipRecent(Clock::time_point modified, Clock::time_point now) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return now - modified < this->config_.skipRecentThreshold;
}

auto SmartScheduler::config() const -> ScannerPerfConfig {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->config_;
}

auto SmartScheduler::state() const -> SchedulerState {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->state_;
}

} // namespace MQ::Scanner
