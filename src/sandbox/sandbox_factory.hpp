/*
 * sandbox_factory.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_SANDBOX_FACTORY_HPP
#define WARDEN_SANDBOX_SANDBOX_FACTORY_HPP

#include "../config/sandbox_config.hpp"
#include "secure_sandbox.hpp"

#include <memory>

namespace warden::sandbox {

/**
 * @brief Whether the worker backend can run on this host
 *
 * True when the worker executable is discovered for @p config.
 */
[[nodiscard]] bool isWorkerSupported(const config::SandboxConfig& config = {});

/**
 * @brief Create a sandbox of the preferred kind
 *
 * A Worker request falls back to a ContextSandbox, with a warning, when
 * the worker is not supported or fails to start.
 *
 * @throws SandboxError InvalidConfiguration for an invalid @p config
 */
[[nodiscard]] std::unique_ptr<SecureSandbox> createSandbox(
    SandboxKind preferred = SandboxKind::Worker,
    const config::SandboxConfig& config = {});

/**
 * @brief Create a sandbox of the kind named by config.backend
 *
 * @throws SandboxError InvalidConfiguration for an unknown backend name
 */
[[nodiscard]] std::unique_ptr<SecureSandbox> createSandbox(
    const config::SandboxConfig& config);

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_SANDBOX_FACTORY_HPP
