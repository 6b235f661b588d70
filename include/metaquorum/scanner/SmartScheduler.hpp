#pragma once
#include "metaquorum/scanner/PerfMonitor.hpp"
#include "metaquorum/scanner/ScannerConfig.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

namespace MQ::Scanner {

struct SchedulerState {
    ScannerMode                      currentMode = ScannerMode::LowLoadOnly;
    std::optional<Clock::time_point> lastScanTime;
    std::optional<Clock::time_point> pauseUntil;
    std::uint32_t                    highLoadCount = 0;
    std::uint32_t                    lowLoadCount  = 0;
};

/*
 * Decides when a background scan may run, based on the configured mode and the load reported
 * by a LoadSource. All methods are thread-safe. Time is passed in so callers and tests can
 * drive it; it defaults to the steady clock.
 */
class SmartScheduler {
public:
    SmartScheduler(ScannerPerfConfig config, LoadSource const& load);

    // LowLoadOnly needs three low readings in a row and pauses after two high ones.
    // Normal pauses for ten seconds after three overload readings.
    [[nodiscard]] auto shouldScan(Clock::time_point now = Clock::now()) -> bool;
    auto               recordScanStart(Clock::time_point now = Clock::now()) -> void;

    // Scales batch size and interval to the current load when smart scheduling is on.
    auto adaptiveAdjust() -> void;

    [[nodiscard]] auto batchSize() const -> std::size_t;
    [[nodiscard]] auto batchInterval() const -> std::chrono::milliseconds;
    [[nodiscard]] auto shouldSkipRecent(Clock::time_point modified, Clock::time_point now = Clock::now()) const -> bool;

    [[nodiscard]] auto config() const -> ScannerPerfConfig;
    [[nodiscard]] auto state() const -> SchedulerState;

private:
    static constexpr std::uint32_t kLowLoadScansAfter  = 3;
    static constexpr std::uint32_t kHighLoadPauseAfter = 2;
    static constexpr std::uint32_t kOverloadPauseAfter = 3;
    static constexpr auto          kOverloadPause      = std::chrono::seconds{10};
    static constexpr std::size_t   kMaxBatchSize       = 200;
    static constexpr std::size_t   kMinMediumBatchSize = 20;

    mutable std::mutex mutex_;
    ScannerPerfConfig  config_;
    SchedulerState     state_;
    LoadSource const&  load_;
};

} // namespace MQ::Scanner
