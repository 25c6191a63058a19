/*
 * types.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "types.hpp"

#include <spdlog/spdlog.h>

namespace warden::sandbox {

SandboxKind sandboxKindFromString(std::string_view name) {
    if (name == "worker") return SandboxKind::Worker;
    if (name == "context" || name == "iframe") return SandboxKind::Context;
    throw SandboxError(SandboxErrorCode::InvalidConfiguration,
                       "Unsupported sandbox type: " + std::string(name));
}

json ResourceLimits::toJson() const {
    return {
        {"memory", memory},
        {"cpu", cpu},
        {"network", network},
        {"storage", storage},
        {"executionTime", executionTime.count()}
    };
}

ResourceLimits ResourceLimits::fromJson(const json& j) {
    ResourceLimits limits;
    limits.memory = j.value("memory", limits.memory);
    limits.cpu = j.value("cpu", limits.cpu);
    limits.network = j.value("network", limits.network);
    limits.storage = j.value("storage", limits.storage);
    limits.executionTime = std::chrono::milliseconds(
        j.value("executionTime", limits.executionTime.count()));
    return limits;
}

json ExecutionMetrics::toJson() const {
    return {
        {"executionTime", executionTime.count()},
        {"memoryUsage", memoryUsage},
        {"cpuUsage", cpuUsage},
        {"networkRequests", networkRequests}
    };
}

json ExecutionResult::toJson() const {
    json j = {
        {"success", success},
        {"metrics", metrics.toJson()},
        {"warnings", warnings}
    };
    if (success) {
        j["output"] = output;
    } else {
        j["error"] = error;
        if (stack) {
            j["stack"] = *stack;
        }
    }

    json logEntries = json::array();
    for (const auto& entry : logs) {
        logEntries.push_back({
            {"level", entry.level},
            {"message", entry.message},
            {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                              entry.timestamp.time_since_epoch())
                              .count()}
        });
    }
    j["logs"] = std::move(logEntries);
    return j;
}

NetworkResponse denyNetworkRequest(const NetworkRequest& request) {
    spdlog::debug("Denied sandbox network request {} {}", request.method,
                  request.url);
    NetworkResponse response;
    response.ok = false;
    response.status = 0;
    response.error = "Network access is not available";
    return response;
}

}  // namespace warden::sandbox
