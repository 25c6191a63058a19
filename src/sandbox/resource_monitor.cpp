/*
 * resource_monitor.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "resource_monitor.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/resource.h>
#include <unistd.h>

namespace warden::sandbox {

std::optional<size_t> ResourceMonitor::getMemoryUsage(int processId) {
    if (processId <= 0) return std::nullopt;

    // statm: size resident shared text lib data dt (pages)
    std::ifstream statm("/proc/" + std::to_string(processId) + "/statm");
    size_t size = 0;
    size_t resident = 0;
    if (statm >> size >> resident) {
        return resident * static_cast<size_t>(sysconf(_SC_PAGESIZE));
    }
    return std::nullopt;
}

std::optional<size_t> ResourceMonitor::getPeakMemoryUsage(int processId) {
    if (processId <= 0) return std::nullopt;

    std::ifstream status("/proc/" + std::to_string(processId) + "/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 6, "VmHWM:") == 0) {
            size_t value = 0;
            if (std::sscanf(line.c_str(), "VmHWM: %zu kB", &value) == 1) {
                return value * 1024;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> ResourceMonitor::getCpuTime(int processId) {
    if (processId <= 0) return std::nullopt;

    std::ifstream statFile("/proc/" + std::to_string(processId) + "/stat");
    std::string content;
    if (!std::getline(statFile, content)) {
        return std::nullopt;
    }

    // The command name may contain spaces; fields resume after the last ')'
    auto closing = content.rfind(')');
    if (closing == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream fields(content.substr(closing + 2));
    std::string field;
    unsigned long long utime = 0;
    unsigned long long stime = 0;
    // state is field 3; utime and stime are fields 14 and 15
    for (int index = 3; index <= 15 && fields >> field; ++index) {
        if (index == 14) utime = std::stoull(field);
        if (index == 15) stime = std::stoull(field);
    }

    long ticks = sysconf(_SC_CLK_TCK);
    if (ticks <= 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds((utime + stime) * 1000ULL /
                                     static_cast<unsigned long long>(ticks));
}

double ResourceMonitor::cpuPercent(std::chrono::milliseconds cpuTime,
                                   std::chrono::milliseconds wallTime) noexcept {
    if (wallTime.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(cpuTime.count()) * 100.0 /
           static_cast<double>(wallTime.count());
}

bool ResourceMonitor::isMemoryLimitExceeded(int processId, size_t limitBytes) {
    if (limitBytes == 0) return false;

    auto memUsage = getMemoryUsage(processId);
    return memUsage && *memUsage > limitBytes;
}

std::chrono::milliseconds ResourceMonitor::selfCpuTime() noexcept {
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return std::chrono::milliseconds{0};
    }
    auto toMs = [](const timeval& tv) {
        return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
    };
    return std::chrono::milliseconds(toMs(usage.ru_utime) + toMs(usage.ru_stime));
}

}  // namespace warden::sandbox
