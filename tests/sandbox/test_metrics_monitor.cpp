/*
 * test_metrics_monitor.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file test_metrics_monitor.cpp
 * @brief Tests for the in-context limit monitor and the terminal gate
 */

#include <gtest/gtest.h>
#include "sandbox/metrics_monitor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

using namespace warden::sandbox;
using namespace std::chrono_literals;

namespace {

ResourceLimits makeLimits(uint64_t memory, std::chrono::milliseconds time) {
    ResourceLimits limits;
    limits.memory = memory;
    limits.executionTime = time;
    return limits;
}

struct Violation {
    LimitViolation kind;
    ExecutionMetrics metrics;
};

}  // namespace

// =============================================================================
// TerminalGate Tests
// =============================================================================

TEST(TerminalGateTest, FirstClaimWins) {
    TerminalGate gate;
    EXPECT_FALSE(gate.isClaimed());
    EXPECT_TRUE(gate.claim());
    EXPECT_TRUE(gate.isClaimed());
    EXPECT_FALSE(gate.claim());
}

TEST(TerminalGateTest, ResetReopens) {
    TerminalGate gate;
    EXPECT_TRUE(gate.claim());
    gate.reset();
    EXPECT_TRUE(gate.claim());
}

TEST(TerminalGateTest, ExactlyOneOfManyThreadsClaims) {
    TerminalGate gate;
    std::atomic<int> winners{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (gate.claim()) {
                ++winners;
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

// =============================================================================
// Limit Check Tests
// =============================================================================

class MetricsMonitorCheckTest : public ::testing::Test {
protected:
    MetricsMonitor monitor_{makeLimits(1000, 500ms), 10ms, [] {
                                return std::optional<size_t>(0);
                            }};
};

TEST_F(MetricsMonitorCheckTest, WithinLimits) {
    EXPECT_FALSE(monitor_.check(100ms, 500).has_value());
}

TEST_F(MetricsMonitorCheckTest, MemoryOverLimit) {
    EXPECT_EQ(monitor_.check(0ms, 1001), LimitViolation::Memory);
}

TEST_F(MetricsMonitorCheckTest, MemoryAtLimitIsAllowed) {
    EXPECT_FALSE(monitor_.check(0ms, 1000).has_value());
}

TEST_F(MetricsMonitorCheckTest, TimeAtLimitIsViolation) {
    EXPECT_EQ(monitor_.check(500ms, 0), LimitViolation::ExecutionTime);
}

TEST_F(MetricsMonitorCheckTest, MemoryIsCheckedFirst) {
    EXPECT_EQ(monitor_.check(900ms, 5000), LimitViolation::Memory);
}

TEST(MetricsMonitorTest, ZeroMeansUnlimited) {
    MetricsMonitor monitor(makeLimits(0, 0ms), 10ms);
    EXPECT_FALSE(monitor.check(std::chrono::hours(1), SIZE_MAX).has_value());
}

TEST(MetricsMonitorTest, ViolationMessages) {
    EXPECT_EQ(limitViolationToString(LimitViolation::Memory), "Memory limit exceeded");
    EXPECT_EQ(limitViolationToString(LimitViolation::ExecutionTime),
              "Execution time limit exceeded");
    EXPECT_EQ(limitViolationToString(LimitViolation::NetworkRequests),
              "Network request limit exceeded");
}

// =============================================================================
// Sampling Loop Tests
// =============================================================================

TEST(MetricsMonitorTest, ReportsMemoryViolationFromSampler) {
    std::atomic<size_t> fakeMemory{100};
    MetricsMonitor monitor(makeLimits(1000, 0ms), 5ms,
                           [&] { return std::optional<size_t>(fakeMemory.load()); });

    std::promise<Violation> reported;
    auto future = reported.get_future();
    monitor.start([&](LimitViolation kind, const ExecutionMetrics& metrics) {
        reported.set_value({kind, metrics});
    });
    EXPECT_TRUE(monitor.isRunning());

    std::this_thread::sleep_for(20ms);
    fakeMemory = 5000;

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto violation = future.get();
    EXPECT_EQ(violation.kind, LimitViolation::Memory);
    EXPECT_EQ(violation.metrics.memoryUsage, 5000u);

    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
}

TEST(MetricsMonitorTest, ReportsTimeViolationWithinOneInterval) {
    MetricsMonitor monitor(makeLimits(0, 100ms), 20ms,
                           [] { return std::optional<size_t>(10); });

    std::promise<Violation> reported;
    auto future = reported.get_future();
    auto start = std::chrono::steady_clock::now();
    monitor.start([&](LimitViolation kind, const ExecutionMetrics& metrics) {
        reported.set_value({kind, metrics});
    });

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto waited = std::chrono::steady_clock::now() - start;
    auto violation = future.get();

    EXPECT_EQ(violation.kind, LimitViolation::ExecutionTime);
    EXPECT_GE(violation.metrics.executionTime, 100ms);
    EXPECT_LT(waited, 400ms);
    monitor.stop();
}

TEST(MetricsMonitorTest, ReportsOnlyOnce) {
    MetricsMonitor monitor(makeLimits(1, 0ms), 1ms,
                           [] { return std::optional<size_t>(100); });
    std::atomic<int> calls{0};
    monitor.start([&](LimitViolation, const ExecutionMetrics&) { ++calls; });
    std::this_thread::sleep_for(50ms);
    monitor.stop();
    EXPECT_EQ(calls.load(), 1);
}

TEST(MetricsMonitorTest, StopBeforeViolationReportsNothing) {
    MetricsMonitor monitor(makeLimits(0, 10s), 5ms,
                           [] { return std::optional<size_t>(1); });
    std::atomic<int> calls{0};
    monitor.start([&](LimitViolation, const ExecutionMetrics&) { ++calls; });
    std::this_thread::sleep_for(20ms);
    monitor.stop();
    monitor.stop();
    EXPECT_EQ(calls.load(), 0);
    EXPECT_FALSE(monitor.isRunning());
}

TEST(MetricsMonitorTest, StopInterruptsLongInterval) {
    MetricsMonitor monitor(makeLimits(0, 0ms), 10s,
                           [] { return std::optional<size_t>(1); });
    monitor.start({});
    auto start = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(MetricsMonitorTest, UnavailableSamplerNeverTripsMemory) {
    MetricsMonitor monitor(makeLimits(1, 0ms), 2ms,
                           [] { return std::optional<size_t>(); });
    std::atomic<int> calls{0};
    monitor.start([&](LimitViolation, const ExecutionMetrics&) { ++calls; });
    std::this_thread::sleep_for(20ms);
    monitor.stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST(MetricsMonitorTest, DefaultSamplerReadsOwnProcess) {
    MetricsMonitor monitor(makeLimits(0, 0ms), 5ms);
    monitor.start({});
    std::this_thread::sleep_for(30ms);
    monitor.stop();
    EXPECT_GT(monitor.snapshot().memoryUsage, 0u);
}

// =============================================================================
// Counters
// =============================================================================

TEST(MetricsMonitorTest, NetworkCountersResetOnStart) {
    MetricsMonitor monitor(makeLimits(0, 0ms), 50ms,
                           [] { return std::optional<size_t>(1); });
    EXPECT_EQ(monitor.recordNetworkRequest(), 1u);
    EXPECT_EQ(monitor.recordNetworkRequest(), 2u);
    monitor.recordNetworkBytes(128);

    monitor.start({});
    EXPECT_EQ(monitor.networkRequests(), 0u);
    EXPECT_EQ(monitor.networkBytes(), 0u);

    EXPECT_EQ(monitor.recordNetworkRequest(), 1u);
    monitor.recordNetworkBytes(10);
    monitor.recordNetworkBytes(5);
    monitor.stop();

    auto metrics = monitor.snapshot();
    EXPECT_EQ(metrics.networkRequests, 1u);
    EXPECT_EQ(monitor.networkBytes(), 15u);
}

TEST(MetricsMonitorTest, ElapsedGrows) {
    MetricsMonitor monitor(makeLimits(0, 0ms), 50ms,
                           [] { return std::optional<size_t>(1); });
    monitor.start({});
    std::this_thread::sleep_for(30ms);
    EXPECT_GE(monitor.elapsed(), 25ms);
    monitor.stop();
    EXPECT_EQ(monitor.limits().executionTime, 0ms);
}
