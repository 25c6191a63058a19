/*
 * context_sandbox.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file context_sandbox.hpp
 * @brief Fallback isolation backend using one forked context per call
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_CONTEXT_SANDBOX_HPP
#define WARDEN_SANDBOX_CONTEXT_SANDBOX_HPP

#include "../config/sandbox_config.hpp"
#include "secure_sandbox.hpp"

#include <memory>

namespace warden::sandbox {

/**
 * @brief Runs each call in a disposable child forked from this process
 *
 * The child is hardened, starts (or re-arms after fork) the embedded
 * interpreter, serves exactly one Execute request and is then killed and
 * reaped. Needs no external executable.
 *
 * @note A host that embeds Python itself must not hold the GIL while a
 *       call is being started.
 */
class ContextSandbox final : public SecureSandbox {
public:
    explicit ContextSandbox(const config::SandboxConfig& config = {});
    ~ContextSandbox() override;

    ContextSandbox(const ContextSandbox&) = delete;
    ContextSandbox& operator=(const ContextSandbox&) = delete;

    [[nodiscard]] std::future<ExecutionResult> executeCode(
        std::string_view code, const ExecutionContext& context = {}) override;

    void limitResources(const ResourceLimitsPatch& limits) override;

    [[nodiscard]] ExecutionMetrics monitorExecution() const override;

    void terminateExecution() override;

    [[nodiscard]] ResourceLimits limits() const override;

    [[nodiscard]] bool isExecuting() const noexcept override;

    [[nodiscard]] SandboxKind kind() const noexcept override {
        return SandboxKind::Context;
    }

    void setConsoleCallback(ConsoleCallback callback) override;

    void setNetworkHandler(NetworkHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_CONTEXT_SANDBOX_HPP
