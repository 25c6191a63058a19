/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "sandbox_config.hpp"

#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace warden::config {

json SandboxConfig::toJson() const {
    return {
        {"backend", backend},
        {"workerExecutable", workerExecutable},
        {"limits", limits.toJson()},
        {"defaultTimeoutMs", defaultTimeoutMs},
        {"monitorIntervalMs", monitorIntervalMs},
        {"networkRequestCap", networkRequestCap},
        {"handshakeTimeoutMs", handshakeTimeoutMs},
        {"workingDirectory", workingDirectory},
        {"logging", logging.toJson()}
    };
}

SandboxConfig SandboxConfig::fromJson(const json& j) {
    SandboxConfig cfg;
    cfg.backend = j.value("backend", cfg.backend);
    cfg.workerExecutable = j.value("workerExecutable", cfg.workerExecutable);
    if (j.contains("limits") && j["limits"].is_object()) {
        cfg.limits = sandbox::ResourceLimits::fromJson(j["limits"]);
    }
    cfg.defaultTimeoutMs = j.value("defaultTimeoutMs", cfg.defaultTimeoutMs);
    cfg.monitorIntervalMs = j.value("monitorIntervalMs", cfg.monitorIntervalMs);
    cfg.networkRequestCap = j.value("networkRequestCap", cfg.networkRequestCap);
    cfg.handshakeTimeoutMs = j.value("handshakeTimeoutMs", cfg.handshakeTimeoutMs);
    cfg.workingDirectory = j.value("workingDirectory", cfg.workingDirectory);
    if (j.contains("logging") && j["logging"].is_object()) {
        cfg.logging = logging::LoggingConfig::fromJson(j["logging"]);
    }
    return cfg;
}

SandboxConfig SandboxConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open sandbox config: " + path.string());
    }

    try {
        return fromJson(json::parse(file));
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed sandbox config " + path.string() +
                                 ": " + e.what());
    }
}

sandbox::SandboxResult<void> SandboxConfig::validate() const {
    if (backend != "worker" && backend != "context" && backend != "iframe") {
        spdlog::error("Unsupported sandbox backend '{}'", backend);
        return std::unexpected(sandbox::SandboxErrorCode::InvalidConfiguration);
    }
    if (monitorIntervalMs == 0) {
        spdlog::error("monitorIntervalMs must be greater than zero");
        return std::unexpected(sandbox::SandboxErrorCode::InvalidConfiguration);
    }
    if (handshakeTimeoutMs == 0) {
        spdlog::error("handshakeTimeoutMs must be greater than zero");
        return std::unexpected(sandbox::SandboxErrorCode::InvalidConfiguration);
    }
    if (limits.cpu < 0 || limits.cpu > 100) {
        spdlog::error("CPU ceiling {} is outside 0..100", limits.cpu);
        return std::unexpected(sandbox::SandboxErrorCode::InvalidConfiguration);
    }
    return {};
}

std::filesystem::path SandboxConfig::effectiveWorkingDirectory() const {
    if (workingDirectory.empty()) {
        return std::filesystem::temp_directory_path();
    }
    return workingDirectory;
}

}  // namespace warden::config
