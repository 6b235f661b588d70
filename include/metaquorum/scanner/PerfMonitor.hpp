#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <vector>

namespace MQ::Scanner {

using Clock = std::chrono::steady_clock;

enum class LoadStatus {
    Idle,
    Low,
    Medium,
    High,
    Overload,
};

[[nodiscard]] auto loadStatusToString(LoadStatus status) -> std::string_view;

struct PerfMetrics {
    double                    currentIops       = 0.0;
    double                    currentThroughput = 0.0; // MiB/s
    std::chrono::microseconds avgWriteLatency{0};
    std::chrono::microseconds p99WriteLatency{0};
    std::size_t               queueDepth  = 0;
    double                    cpuUsage    = 0.0; // percent
    double                    memoryUsage = 0.0; // percent
};

// Read-only view of system load, consumed by the scan scheduler.
class LoadSource {
public:
    virtual ~LoadSource() = default;

    [[nodiscard]] virtual auto loadStatus() const -> LoadStatus = 0;
    [[nodiscard]] virtual auto currentIops() const -> double    = 0;
};

// Classification shared by every load source: both the IOPS and the CPU bound of a band must hold.
[[nodiscard]] auto classifyLoad(double iops, double cpuPercent) -> LoadStatus;

/*
 * Write-rate monitor. Writers call recordWrite from any thread; updateMetrics folds the
 * counters into a new sample once the sample window has elapsed. CPU and memory usage come
 * from injectable samplers, which read /proc by default.
 */
class PerfMonitor final : public LoadSource {
public:
    using Sampler = std::function<double()>;

    PerfMonitor();
    PerfMonitor(Sampler cpuSampler, Sampler memorySampler, std::chrono::milliseconds sampleWindow = std::chrono::seconds{1});

    PerfMonitor(PerfMonitor const&)            = delete;
    PerfMonitor& operator=(PerfMonitor const&) = delete;

    auto recordWrite(std::size_t bytes, std::chrono::microseconds latency) -> void;
    auto setQueueDepth(std::size_t depth) -> void;

    // Returns false when the window has not elapsed yet and nothing changed.
    auto updateMetrics(Clock::time_point now = Clock::now()) -> bool;

    [[nodiscard]] auto loadStatus() const -> LoadStatus override;
    [[nodiscard]] auto currentIops() const -> double override;
    [[nodiscard]] auto shouldPauseScan(std::uint64_t iopsThreshold) const -> bool;
    [[nodiscard]] auto metrics() const -> PerfMetrics;

private:
    static constexpr std::size_t kLatencySamples = 4096;

    std::atomic<std::uint64_t> writeCount{0};
    std::atomic<std::uint64_t> bytesWritten{0};
    std::atomic<std::size_t>   queueDepth{0};

    mutable std::mutex                     latencyMutex;
    std::vector<std::chrono::microseconds> latencies;

    mutable std::mutex        metricsMutex;
    PerfMetrics               recent;
    Clock::time_point         lastSample;
    std::chrono::milliseconds sampleWindow;
    Sampler                   cpuSampler;
    Sampler                   memorySampler;
};

// Process-wide monitor fed by the storage layer.
[[nodiscard]] auto globalPerfMonitor() -> PerfMonitor&;

// Starts a background thread calling updateMetrics on the global monitor. False if already running.
auto startPerfMonitoring(std::chrono::milliseconds interval = std::chrono::seconds{1}) -> bool;
auto stopPerfMonitoring() -> void;
[[nodiscard]] auto perfMonitoringActive() -> bool;

} // namespace MQ::Scanner
