/*
 * resource_monitor.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_RESOURCE_MONITOR_HPP
#define WARDEN_SANDBOX_RESOURCE_MONITOR_HPP

#include <chrono>
#include <cstddef>
#include <optional>

namespace warden::sandbox {

/**
 * @brief Per-process resource sampling from procfs
 */
class ResourceMonitor {
public:
    /**
     * @brief Get resident memory of a process
     * @param processId Process ID to query
     * @return Resident set size in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getMemoryUsage(int processId);

    /**
     * @brief Get peak resident memory (VmHWM) of a process
     * @param processId Process ID to query
     * @return Bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getPeakMemoryUsage(int processId);

    /**
     * @brief Get user plus system CPU time consumed by a process
     * @param processId Process ID to query
     * @return CPU time or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<std::chrono::milliseconds> getCpuTime(
        int processId);

    /**
     * @brief Average CPU usage over a wall-clock window
     * @param cpuTime CPU time consumed during the window
     * @param wallTime Length of the window
     * @return Percent of one core, 0 for an empty window
     */
    [[nodiscard]] static double cpuPercent(std::chrono::milliseconds cpuTime,
                                           std::chrono::milliseconds wallTime) noexcept;

    /**
     * @brief Check if a process exceeds a memory limit
     * @param processId Process ID to check
     * @param limitBytes Limit in bytes, 0 = unlimited
     */
    [[nodiscard]] static bool isMemoryLimitExceeded(int processId,
                                                    size_t limitBytes);

    /**
     * @brief CPU time of the calling process from getrusage
     */
    [[nodiscard]] static std::chrono::milliseconds selfCpuTime() noexcept;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_RESOURCE_MONITOR_HPP
