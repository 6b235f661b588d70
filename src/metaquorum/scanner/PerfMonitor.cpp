#include "metaquorum/scanner/PerfMonitor.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace MQ::Scanner {
namespace {

using namespace std::chrono_literals;

struct CpuTimes {
    std::uint64_t busy  = 0;
    std::uint64_t total = 0;
};

[[nodiscard]] auto read_cpu_times() -> std::optional<CpuTimes> {
    std::ifstream stat("/proc/stat");
    std::string   label;
    if (!(stat >> label) || label != "cpu") {
        return std::nullopt;
    }
    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    stat >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    if (!stat) {
        return std::nullopt;
    }
    CpuTimes times;
    times.busy  = user + nice + system + irq + softirq + steal;
    times.total = times.busy + idle + iowait;
    return times;
}

// Busy share of CPU time since the previous call.
[[nodiscard]] auto proc_cpu_sampler() -> PerfMonitor::Sampler {
    auto previous = std::make_shared<CpuTimes>();
    return [previous]() -> double {
        auto current = read_cpu_times();
        if (!current) {
            return 0.0;
        }
        auto const busy  = current->busy - std::min(current->busy, previous->busy);
        auto const total = current->total - std::min(current->total, previous->total);
        *previous        = *current;
        if (total == 0) {
            return 0.0;
        }
        return 100.0 * static_cast<double>(busy) / static_cast<double>(total);
    };
}

[[nodiscard]] auto proc_memory_sampler() -> PerfMonitor::Sampler {
    return []() -> double {
        std::ifstream meminfo("/proc/meminfo");
        std::string   line;
        std::uint64_t total     = 0;
        std::uint64_t available = 0;
        while (std::getline(meminfo, line)) {
            std::istringstream fields(line);
            std::string        key;
            std::uint64_t      value = 0;
            fields >> key >> value;
            if (key == "MemTotal:") {
                total = value;
            } else if (key == "MemAvailable:") {
                available = value;
            }
        }
        if (total == 0) {
            return 0.0;
        }
        return 100.0 * (1.0 - static_cast<double>(std::min(available, total)) / static_cast<double>(total));
    };
}

class PerfSamplerWorker {
public:
    explicit PerfSamplerWorker(std::chrono::milliseconds interval) : interval_(interval) {}

    ~PerfSamplerWorker() { stop(); }

    PerfSamplerWorker(PerfSamplerWorker const&)            = delete;
    PerfSamplerWorker& operator=(PerfSamplerWorker const&) = delete;

    void start() {
        if (worker_.joinable()) {
            return;
        }
        stop_flag_.store(false, std::memory_order_release);
        worker_ = std::thread([this] { run(); });
    }

    void stop() {
        stop_flag_.store(true, std::memory_order_release);
        if (worker_.joinable()) {
            worker_.join();
        }
    }

private:
    void run() {
        set_thread_name("PerfSampler");
        mq_log("perf sampler started, interval " + std::to_string(interval_.count()) + "ms", "PerfMonitor");
        auto next = Clock::now() + interval_;
        while (!stop_flag_.load(std::memory_order_acquire)) {
            if (Clock::now() < next) {
                std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(interval_, 20ms));
                continue;
            }
            globalPerfMonitor().updateMetrics();
            next += interval_;
        }
        mq_log("perf sampler stopped", "PerfMonitor");
    }

    static void set_thread_name([[maybe_unused]] std::string const& name) {
#ifdef MQ_LOG_DEBUG
        ::MQ::set_thread_name(name);
#endif
    }

    std::chrono::milliseconds interval_;
    std::atomic<bool>         stop_flag_{false};
    std::thread               worker_;
};

struct SamplerSlot {
    std::mutex                         mutex;
    std::unique_ptr<PerfSamplerWorker> worker;
};

// Constructed after the monitor and the logger the sampler thread uses, so static teardown
// destroys the slot, and joins a sampler that was never stopped, before either of them.
auto sampler_slot() -> SamplerSlot& {
#ifdef MQ_LOG_DEBUG
    (void)::MQ::logger();
#endif
    (void)globalPerfMonitor();
    static SamplerSlot slot;
    return slot;
}

} // namespace

auto loadStatusToString(LoadStatus status) -> std::string_view {
    switch (status) {
    case LoadStatus::Idle:
        return "idle";
    case LoadStatus::Low:
        return "low";
    case LoadStatus::Medium:
        return "medium";
    case LoadStatus::High:
        return "high";
    case LoadStatus::Overload:
        return "overload";
    }
    return "unknown";
}

auto classifyLoad(double iops, double cpuPercent) -> LoadStatus {
    if (iops < 100.0 && cpuPercent < 20.0) {
        return LoadStatus::Idle;
    }
    if (iops < 500.0 && cpuPercent < 40.0) {
        return LoadStatus::Low;
    }
    if (iops < 1000.0 && cpuPercent < 60.0) {
        return LoadStatus::Medium;
    }
    if (iops < 5000.0 && cpuPercent < 80.0) {
        return LoadStatus::High;
    }
    return LoadStatus::Overload;
}

PerfMonitor::PerfMonitor()
    : PerfMonitor(proc_cpu_sampler(), proc_memory_sampler()) {}

PerfMonitor::PerfMonitor(Sampler cpuSampler, Sampler memorySampler, std::chrono::milliseconds sampleWindow)
    : lastSample(Clock::now()), sampleWindow(sampleWindow), cpuSampler(std::move(cpuSampler)), memorySampler(std::move(memorySampler)) {
    this->latencies.reserve(kLatencySamples);
}

auto PerfMonitor::recordWrite(std::size_t bytes, std::chrono::microseconds latency) -> void {
    this->writeCount.fetch_add(1, std::memory_order_relaxed);
    this->bytesWritten.fetch_add(bytes, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(this->latencyMutex);
    if (this->latencies.size() < kLatencySamples) {
        this->latencies.push_back(latency);
    }
}

auto PerfMonitor::setQueueDepth(std::size_t depth) -> void {
    this->queueDepth.store(depth, std::memory_order_relaxed);
}

auto PerfMonitor::updateMetrics(Clock::time_point now) -> bool {
    std::lock_guard<std::mutex> lock(this->metricsMutex);
    auto const                  elapsed = now - this->lastSample;
    if (elapsed < this->sampleWindow) {
        return false;
    }

    auto const writes  = this->writeCount.exchange(0, std::memory_order_relaxed);
    auto const bytes   = this->bytesWritten.exchange(0, std::memory_order_relaxed);
    auto const seconds = std::chrono::duration<double>(elapsed).count();

    std::vector<std::chrono::microseconds> window;
    {
        std::lock_guard<std::mutex> latencyLock(this->latencyMutex);
        window.swap(this->latencies);
        this->latencies.reserve(kLatencySamples);
    }

    this->recent.currentIops       = static_cast<double>(writes) / seconds;
    this->recent.currentThroughput = (static_cast<double>(bytes) / 1024.0 / 1024.0) / seconds;
    this->recent.queueDepth        = this->queueDepth.load(std::memory_order_relaxed);
    if (window.empty()) {
        this->recent.avgWriteLatency = std::chrono::microseconds{0};
        this->recent.p99WriteLatency = std::chrono::microseconds{0};
    } else {
        std::chrono::microseconds sum{0};
        for (auto latency : window) {
            sum += latency;
        }
        this->recent.avgWriteLatency = sum / static_cast<std::int64_t>(window.size());
        auto const rank              = (window.size() * 99 + 99) / 100 - 1;
        std::nth_element(window.begin(), window.begin() + static_cast<std::ptrdiff_t>(rank), window.end());
        this->recent.p99WriteLatency = window[rank];
    }
    this->recent.cpuUsage    = this->cpuSampler ? this->cpuSampler() : 0.0;
    this->recent.memoryUsage = this->memorySampler ? this->memorySampler() : 0.0;
    this->lastSample         = now;
    return true;
}

auto PerfMonitor::loadStatus() const -> LoadStatus {
    std::lock_guard<std::mutex> lock(this->metricsMutex);
    return classifyLoad(this->recent.currentIops, this->recent.cpuUsage);
}

auto PerfMonitor::currentIops() const -> double {
    std::lock_guard<std::mutex> lock(this->metricsMutex);
    return this->recent.currentIops;
}

auto PerfMonitor::shouldPauseScan(std::uint64_t iopsThreshold) const -> bool {
    std::lock_guard<std::mutex> lock(this->metricsMutex);
    return this->recent.currentIops > static_cast<double>(iopsThreshold) || this->recent.cpuUsage > 70.0;
}

auto PerfMonitor::metrics() const -> PerfMetrics {
    std::lock_guard<std::mutex> lock(this->metricsMutex);
    return this->recent;
}

auto globalPerfMonitor() -> PerfMonitor& {
    static PerfMonitor monitor;
    return monitor;
}

auto startPerfMonitoring(std::chrono::milliseconds interval) -> bool {
    auto&                       slot = sampler_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.worker) {
        return false;
    }
    slot.worker = std::make_unique<PerfSamplerWorker>(interval);
    slot.worker->start();
    return true;
}

auto stopPerfMonitoring() -> void {
    std::unique_ptr<PerfSamplerWorker> sampler;
    {
        auto&                       slot = sampler_slot();
        std::lock_guard<std::mutex> lock(slot.mutex);
        sampler = std::move(slot.worker);
    }
    if (sampler) {
        sampler->stop();
    }
}

auto perfMonitoringActive() -> bool {
    auto&                       slot = sampler_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.worker != nullptr;
}

} // namespace MQ::Scanner
