/*
 * config_discovery.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "config_discovery.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

#ifndef WARDEN_LIBEXEC_DIR
#define WARDEN_LIBEXEC_DIR "/usr/local/libexec/warden"
#endif

namespace warden::sandbox {

namespace {

std::optional<std::filesystem::path> currentExecutableDir() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return self.parent_path();
}

std::vector<std::filesystem::path> pathEntries() {
    std::vector<std::filesystem::path> entries;
    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return entries;
    }

    std::string_view remaining(path);
    while (!remaining.empty()) {
        auto sep = remaining.find(':');
        auto entry = remaining.substr(0, sep);
        if (!entry.empty()) {
            entries.emplace_back(entry);
        }
        if (sep == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(sep + 1);
    }
    return entries;
}

}  // namespace

bool ConfigDiscovery::isExecutable(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> ConfigDiscovery::findWorkerExecutable(
    const config::SandboxConfig& config) {
    if (!config.workerExecutable.empty()) {
        if (isExecutable(config.workerExecutable)) {
            return std::filesystem::path(config.workerExecutable);
        }
        spdlog::warn("Configured worker {} is not executable",
                     config.workerExecutable);
    }

    if (const char* env = std::getenv("WARDEN_WORKER_PATH"); env && *env) {
        if (isExecutable(env)) {
            return std::filesystem::path(env);
        }
        spdlog::warn("WARDEN_WORKER_PATH={} is not executable", env);
    }

    std::vector<std::filesystem::path> searchPaths;
    if (auto selfDir = currentExecutableDir()) {
        searchPaths.push_back(*selfDir / WORKER_NAME);
    }
    searchPaths.push_back(std::filesystem::path(WARDEN_LIBEXEC_DIR) / WORKER_NAME);
    for (const auto& dir : pathEntries()) {
        searchPaths.push_back(dir / WORKER_NAME);
    }

    for (const auto& path : searchPaths) {
        if (isExecutable(path)) {
            spdlog::debug("Found sandbox worker at {}", path.string());
            return path;
        }
    }

    return std::nullopt;
}

SandboxResult<void> ConfigDiscovery::validateConfig(
    const config::SandboxConfig& config, bool requireWorker) {
    if (auto valid = config.validate(); !valid) {
        return valid;
    }

    if (!config.workingDirectory.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(config.workingDirectory, ec)) {
            spdlog::error("Sandbox working directory {} does not exist",
                          config.workingDirectory);
            return std::unexpected(SandboxErrorCode::InvalidConfiguration);
        }
    }

    if (requireWorker && !findWorkerExecutable(config)) {
        return std::unexpected(SandboxErrorCode::WorkerUnavailable);
    }

    return {};
}

}  // namespace warden::sandbox
