/*
 * secure_sandbox.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file secure_sandbox.hpp
 * @brief Common interface of the isolation backends
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_SECURE_SANDBOX_HPP
#define WARDEN_SANDBOX_SECURE_SANDBOX_HPP

#include <future>
#include <string_view>

#include "types.hpp"

namespace warden::sandbox {

/**
 * @brief Runs untrusted code in an isolated process and reports its outcome
 *
 * One execution is in flight per instance at a time. Guest failures and
 * limit violations resolve the future with ExecutionResult{success=false};
 * timeout, termination, concurrent use and infrastructure failures make
 * the future throw SandboxError.
 */
class SecureSandbox {
public:
    virtual ~SecureSandbox() = default;

    /**
     * @brief Sanitize and run code in the isolated context
     *
     * A call made while another is in flight returns an already-ready
     * future holding SandboxError{AlreadyExecuting}.
     */
    [[nodiscard]] virtual std::future<ExecutionResult> executeCode(
        std::string_view code, const ExecutionContext& context = {}) = 0;

    /**
     * @brief Update some of the resource limits; applies to later calls
     */
    virtual void limitResources(const ResourceLimitsPatch& limits) = 0;

    /**
     * @brief Live metrics of the current call, or the last call's final
     *        metrics when idle
     */
    [[nodiscard]] virtual ExecutionMetrics monitorExecution() const = 0;

    /**
     * @brief Kill the isolated context of the current call
     *
     * The pending future fails with SandboxError{Terminated}. No-op when idle.
     */
    virtual void terminateExecution() = 0;

    [[nodiscard]] virtual ResourceLimits limits() const = 0;

    [[nodiscard]] virtual bool isExecuting() const noexcept = 0;

    [[nodiscard]] virtual SandboxKind kind() const noexcept = 0;

    virtual void setConsoleCallback(ConsoleCallback callback) = 0;

    virtual void setNetworkHandler(NetworkHandler handler) = 0;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_SECURE_SANDBOX_HPP
