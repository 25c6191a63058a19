/*
 * metrics_monitor.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "metrics_monitor.hpp"
#include "resource_monitor.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

#include <unistd.h>

namespace warden::sandbox {

class MetricsMonitor::Impl {
public:
    Impl(const ResourceLimits& limits, std::chrono::milliseconds interval,
         MemorySampler sampler)
        : limits_(limits),
          interval_(std::max(interval, std::chrono::milliseconds{1})),
          sampler_(std::move(sampler)) {
        if (!sampler_) {
            sampler_ = [] {
                return ResourceMonitor::getMemoryUsage(static_cast<int>(::getpid()));
            };
        }
    }

    ~Impl() { stop(); }

    void start(ViolationHandler onViolation) {
        stop();

        startTime_ = std::chrono::steady_clock::now();
        cpuStart_ = ResourceMonitor::selfCpuTime();
        peakMemory_ = 0;
        networkRequests_ = 0;
        networkBytes_ = 0;
        running_ = true;

        thread_ = std::jthread([this, handler = std::move(onViolation)](
                                   std::stop_token stopToken) {
            run(stopToken, handler);
        });
    }

    void stop() {
        if (thread_.joinable()) {
            thread_.request_stop();
            wakeup_.notify_all();
            thread_.join();
        }
        running_ = false;
    }

    std::optional<LimitViolation> check(std::chrono::milliseconds elapsed,
                                        size_t memory) const noexcept {
        if (limits_.memory > 0 && memory > limits_.memory) {
            return LimitViolation::Memory;
        }
        if (limits_.executionTime.count() > 0 &&
            elapsed >= limits_.executionTime) {
            return LimitViolation::ExecutionTime;
        }
        return std::nullopt;
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

    ExecutionMetrics snapshot() const {
        ExecutionMetrics metrics;
        metrics.executionTime = elapsed();
        metrics.memoryUsage = peakMemory_.load();
        metrics.cpuUsage = ResourceMonitor::cpuPercent(
            ResourceMonitor::selfCpuTime() - cpuStart_, metrics.executionTime);
        metrics.networkRequests = networkRequests_.load();
        return metrics;
    }

    void recordPeak(uint64_t memory) {
        auto previous = peakMemory_.load();
        while (memory > previous &&
               !peakMemory_.compare_exchange_weak(previous, memory)) {
        }
    }

    ResourceLimits limits_;
    std::chrono::milliseconds interval_;
    MemorySampler sampler_;

    std::chrono::steady_clock::time_point startTime_{std::chrono::steady_clock::now()};
    std::chrono::milliseconds cpuStart_{0};
    std::atomic<uint64_t> peakMemory_{0};
    std::atomic<uint32_t> networkRequests_{0};
    std::atomic<uint64_t> networkBytes_{0};
    std::atomic<bool> running_{false};

private:
    void run(std::stop_token stopToken, const ViolationHandler& handler) {
        while (!stopToken.stop_requested()) {
            auto memory = sampler_();
            if (memory) {
                recordPeak(*memory);
            }
            auto violation = check(elapsed(), memory.value_or(0));
            if (violation) {
                running_ = false;
                if (handler) {
                    handler(*violation, snapshot());
                }
                return;
            }

            std::unique_lock lock(mutex_);
            wakeup_.wait_for(lock, stopToken, interval_, [] { return false; });
        }
    }

    std::mutex mutex_;
    std::condition_variable_any wakeup_;
    std::jthread thread_;
};

MetricsMonitor::MetricsMonitor(const ResourceLimits& limits,
                               std::chrono::milliseconds interval,
                               MemorySampler sampler)
    : pImpl_(std::make_unique<Impl>(limits, interval, std::move(sampler))) {}

MetricsMonitor::~MetricsMonitor() = default;

void MetricsMonitor::start(ViolationHandler onViolation) {
    pImpl_->start(std::move(onViolation));
}

void MetricsMonitor::stop() { pImpl_->stop(); }

bool MetricsMonitor::isRunning() const noexcept { return pImpl_->running_.load(); }

std::optional<LimitViolation> MetricsMonitor::check(
    std::chrono::milliseconds elapsed, size_t memory) const noexcept {
    return pImpl_->check(elapsed, memory);
}

ExecutionMetrics MetricsMonitor::snapshot() const { return pImpl_->snapshot(); }

std::chrono::milliseconds MetricsMonitor::elapsed() const {
    return pImpl_->elapsed();
}

uint32_t MetricsMonitor::recordNetworkRequest() noexcept {
    return ++pImpl_->networkRequests_;
}

void MetricsMonitor::recordNetworkBytes(uint64_t bytes) noexcept {
    pImpl_->networkBytes_ += bytes;
}

uint32_t MetricsMonitor::networkRequests() const noexcept {
    return pImpl_->networkRequests_.load();
}

uint64_t MetricsMonitor::networkBytes() const noexcept {
    return pImpl_->networkBytes_.load();
}

const ResourceLimits& MetricsMonitor::limits() const noexcept {
    return pImpl_->limits_;
}

}  // namespace warden::sandbox
