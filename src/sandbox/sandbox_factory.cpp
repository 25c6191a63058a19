/*
 * sandbox_factory.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "sandbox_factory.hpp"
#include "config_discovery.hpp"
#include "context_sandbox.hpp"
#include "worker_sandbox.hpp"

#include <spdlog/spdlog.h>

namespace warden::sandbox {

bool isWorkerSupported(const config::SandboxConfig& config) {
    return ConfigDiscovery::findWorkerExecutable(config).has_value();
}

std::unique_ptr<SecureSandbox> createSandbox(SandboxKind preferred,
                                             const config::SandboxConfig& config) {
    if (auto valid = config.validate(); !valid) {
        throw SandboxError(valid.error(), "Invalid sandbox configuration");
    }

    if (preferred == SandboxKind::Worker) {
        if (isWorkerSupported(config)) {
            try {
                return std::make_unique<WorkerSandbox>(config);
            } catch (const SandboxError& e) {
                spdlog::warn("Worker sandbox unavailable ({}), falling back to "
                             "context sandbox",
                             e.what());
            }
        } else {
            spdlog::warn("Sandbox worker executable not found, falling back to "
                         "context sandbox");
        }
    }

    return std::make_unique<ContextSandbox>(config);
}

std::unique_ptr<SecureSandbox> createSandbox(const config::SandboxConfig& config) {
    return createSandbox(sandboxKindFromString(config.backend), config);
}

}  // namespace warden::sandbox
