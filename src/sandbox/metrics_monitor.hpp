/*
 * metrics_monitor.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file metrics_monitor.hpp
 * @brief Limit enforcement loop running inside the isolated context
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_METRICS_MONITOR_HPP
#define WARDEN_SANDBOX_METRICS_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "types.hpp"

namespace warden::sandbox {

/**
 * @brief One-shot claim on the right to emit the terminal message
 *
 * The executing thread and the monitor thread race to end a run; only the
 * side that claims the gate may send Result or Error.
 */
class TerminalGate {
public:
    /**
     * @brief Try to claim the gate
     * @return True for exactly one caller
     */
    [[nodiscard]] bool claim() noexcept {
        bool expected = false;
        return claimed_.compare_exchange_strong(expected, true);
    }

    [[nodiscard]] bool isClaimed() const noexcept { return claimed_.load(); }

    void reset() noexcept { claimed_ = false; }

private:
    std::atomic<bool> claimed_{false};
};

/**
 * @brief Periodic sampler of elapsed time and memory
 *
 * start() records the start timestamp, resets the network counters and
 * launches a thread that re-checks the limits every interval. The first
 * violation is reported once through the handler and ends the loop.
 */
class MetricsMonitor {
public:
    using MemorySampler = std::function<std::optional<size_t>()>;
    using ViolationHandler =
        std::function<void(LimitViolation violation, const ExecutionMetrics& metrics)>;

    /**
     * @param limits Limits to enforce
     * @param interval Sampling period
     * @param sampler Memory probe; defaults to resident memory of this process
     */
    MetricsMonitor(const ResourceLimits& limits,
                   std::chrono::milliseconds interval,
                   MemorySampler sampler = {});
    ~MetricsMonitor();

    MetricsMonitor(const MetricsMonitor&) = delete;
    MetricsMonitor& operator=(const MetricsMonitor&) = delete;

    /**
     * @brief Begin a run and start sampling
     */
    void start(ViolationHandler onViolation);

    /**
     * @brief Stop sampling and join the thread; safe to call twice
     */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    /**
     * @brief Pure limit check used by every tick
     */
    [[nodiscard]] std::optional<LimitViolation> check(
        std::chrono::milliseconds elapsed, size_t memory) const noexcept;

    /**
     * @brief Metrics of the current run so far
     */
    [[nodiscard]] ExecutionMetrics snapshot() const;

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

    /**
     * @brief Count a fetch attempt
     * @return Attempts so far, this one included
     */
    uint32_t recordNetworkRequest() noexcept;

    void recordNetworkBytes(uint64_t bytes) noexcept;

    [[nodiscard]] uint32_t networkRequests() const noexcept;
    [[nodiscard]] uint64_t networkBytes() const noexcept;

    [[nodiscard]] const ResourceLimits& limits() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_METRICS_MONITOR_HPP
