/*
 * worker_sandbox.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file worker_sandbox.hpp
 * @brief Isolation backend backed by the warden-worker executable
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_WORKER_SANDBOX_HPP
#define WARDEN_SANDBOX_WORKER_SANDBOX_HPP

#include "../config/sandbox_config.hpp"
#include "secure_sandbox.hpp"

#include <memory>

namespace warden::sandbox {

/**
 * @brief Runs code in a persistent worker process
 *
 * The worker is spawned and greeted on construction. After every call,
 * whatever its outcome, the worker is shut down; the next call spawns and
 * greets a new one before dispatching, so no guest state survives between
 * calls.
 */
class WorkerSandbox final : public SecureSandbox {
public:
    /**
     * @throws SandboxError WorkerUnavailable if the worker cannot be found,
     *         started or greeted
     */
    explicit WorkerSandbox(const config::SandboxConfig& config = {});
    ~WorkerSandbox() override;

    WorkerSandbox(const WorkerSandbox&) = delete;
    WorkerSandbox& operator=(const WorkerSandbox&) = delete;

    [[nodiscard]] std::future<ExecutionResult> executeCode(
        std::string_view code, const ExecutionContext& context = {}) override;

    void limitResources(const ResourceLimitsPatch& limits) override;

    [[nodiscard]] ExecutionMetrics monitorExecution() const override;

    void terminateExecution() override;

    [[nodiscard]] ResourceLimits limits() const override;

    [[nodiscard]] bool isExecuting() const noexcept override;

    [[nodiscard]] SandboxKind kind() const noexcept override {
        return SandboxKind::Worker;
    }

    void setConsoleCallback(ConsoleCallback callback) override;

    void setNetworkHandler(NetworkHandler handler) override;

    /**
     * @brief PID of the provisioned worker, or -1 between workers
     */
    [[nodiscard]] int workerProcessId() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_WORKER_SANDBOX_HPP
