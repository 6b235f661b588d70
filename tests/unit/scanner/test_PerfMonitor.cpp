#include "metaquorum/scanner/PerfMonitor.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <thread>

using namespace MQ::Scanner;
using namespace std::chrono_literals;

TEST_SUITE("scanner.perf") {
    TEST_CASE("Load bands") {
        CHECK(classifyLoad(0.0, 0.0) == LoadStatus::Idle);
        CHECK(classifyLoad(99.0, 19.0) == LoadStatus::Idle);
        CHECK(classifyLoad(100.0, 10.0) == LoadStatus::Low);
        CHECK(classifyLoad(50.0, 30.0) == LoadStatus::Low);
        CHECK(classifyLoad(700.0, 10.0) == LoadStatus::Medium);
        CHECK(classifyLoad(10.0, 55.0) == LoadStatus::Medium);
        CHECK(classifyLoad(2000.0, 10.0) == LoadStatus::High);
        CHECK(classifyLoad(6000.0, 10.0) == LoadStatus::Overload);
        CHECK(classifyLoad(10.0, 95.0) == LoadStatus::Overload);
        CHECK(loadStatusToString(LoadStatus::Overload) == "overload");
    }

    TEST_CASE("Window folds writes into a sample") {
        PerfMonitor monitor([] { return 10.0; }, [] { return 42.0; }, 1s);
        auto const  start = Clock::now();

        for (int i = 1; i <= 300; ++i) {
            monitor.recordWrite(1024 * 1024, std::chrono::microseconds{i});
        }
        monitor.setQueueDepth(7);

        CHECK_FALSE(monitor.updateMetrics(start));
        CHECK(monitor.currentIops() == 0.0);

        REQUIRE(monitor.updateMetrics(start + 1s));
        auto metrics = monitor.metrics();
        CHECK(metrics.currentIops == doctest::Approx(300.0).epsilon(0.01));
        CHECK(metrics.currentThroughput == doctest::Approx(300.0).epsilon(0.01));
        CHECK(metrics.avgWriteLatency == 150us);
        CHECK(metrics.p99WriteLatency == 297us);
        CHECK(metrics.queueDepth == 7);
        CHECK(metrics.cpuUsage == 10.0);
        CHECK(metrics.memoryUsage == 42.0);

        CHECK(monitor.loadStatus() == LoadStatus::Low);
        CHECK(monitor.shouldPauseScan(100));
        CHECK_FALSE(monitor.shouldPauseScan(1000));
    }

    TEST_CASE("Busy CPU pauses scans regardless of IOPS") {
        PerfMonitor monitor([] { return 85.0; }, [] { return 0.0; }, 1ms);
        REQUIRE(monitor.updateMetrics(Clock::now() + 1s));
        CHECK(monitor.currentIops() == 0.0);
        CHECK(monitor.shouldPauseScan(1000));
        CHECK(monitor.loadStatus() == LoadStatus::Overload);
    }

    TEST_CASE("Background sampling starts once") {
        stopPerfMonitoring();
        REQUIRE(startPerfMonitoring(10ms));
        CHECK(perfMonitoringActive());
        CHECK_FALSE(startPerfMonitoring(10ms));
        std::this_thread::sleep_for(30ms);
        stopPerfMonitoring();
        CHECK_FALSE(perfMonitoringActive());
        stopPerfMonitoring();
    }

    TEST_CASE("Background sampling restarts after a stop") {
        stopPerfMonitoring();
        REQUIRE(startPerfMonitoring(10ms));
        stopPerfMonitoring();
        REQUIRE(startPerfMonitoring(10ms));
        CHECK(perfMonitoringActive());
        std::this_thread::sleep_for(30ms);
        stopPerfMonitoring();
        CHECK_FALSE(perfMonitoringActive());
    }

    // Left running on purpose: process teardown has to stop the sampler before the monitor goes away.
    TEST_CASE("Sampler still running at exit") {
        stopPerfMonitoring();
        REQUIRE(startPerfMonitoring(1ms));
        CHECK(perfMonitoringActive());
    }
}
