/*
 * execution_session.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_EXECUTION_SESSION_HPP
#define WARDEN_SANDBOX_EXECUTION_SESSION_HPP

#include "../config/sandbox_config.hpp"
#include "../ipc/message.hpp"
#include "lifecycle.hpp"
#include "message_handlers.hpp"
#include "resource_limiter.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sandbox {

/**
 * @brief Everything sent to the sandbox for one call
 */
struct DispatchPlan {
    ipc::ExecuteRequest request;
    std::chrono::milliseconds timeout{0};   ///< Controller deadline
    std::vector<std::string> warnings;      ///< Sanitizer removals
};

/**
 * @brief Sanitize the code and merge the context with the active limits
 */
[[nodiscard]] DispatchPlan prepareDispatch(std::string_view code,
                                           const ExecutionContext& context,
                                           const ResourceLimiter& limiter,
                                           const config::SandboxConfig& config);

/**
 * @brief Fresh non-zero id for a sandbox channel
 */
[[nodiscard]] uint32_t generateContextId();

/**
 * @brief Public error for a call that ended without a terminal message
 * @param code Failure reported by ExecutionSession::run or provisioning
 * @param timeout Deadline of the call, quoted by the timeout message
 */
[[nodiscard]] SandboxError describeFailure(SandboxErrorCode code,
                                           std::chrono::milliseconds timeout);

/**
 * @brief Already-ready future holding @p error
 */
[[nodiscard]] std::future<ExecutionResult> rejectedFuture(const SandboxError& error);

/**
 * @brief In-flight bookkeeping shared by the backends
 *
 * Serializes calls and routes terminateExecution() to the process of the
 * current call. A termination requested before the session starts is
 * held and delivered when it does.
 */
class ExecutionControl {
public:
    /**
     * @brief Claim the instance for one call
     * @return False if a call is already in flight
     */
    [[nodiscard]] bool tryBegin();

    /**
     * @brief Mark the session as running on @p lifecycle
     */
    void enterSession(ProcessLifecycle& lifecycle);

    void leaveSession();

    /**
     * @brief Release the instance after the call is fully wound down
     */
    void finish() noexcept;

    /**
     * @brief Kill the current call's process, or hold the request until
     *        the session starts. No-op when idle.
     */
    void terminate(ProcessLifecycle& lifecycle);

    [[nodiscard]] bool isExecuting() const noexcept;

private:
    mutable std::mutex mutex_;
    std::atomic<bool> executing_{false};
    bool inSession_{false};
    bool pendingTermination_{false};
};

/**
 * @brief Controller-side view of the running call
 *
 * Backs monitorExecution(): live numbers while a call is active, the
 * final metrics of the last call otherwise.
 */
class ExecutionTracker {
public:
    void begin(int processId);
    void recordNetworkRequest();
    void finish(const ExecutionMetrics& metrics);
    void abandon();

    [[nodiscard]] bool isActive() const;
    [[nodiscard]] ExecutionMetrics snapshot() const;

private:
    mutable std::mutex mutex_;
    bool active_{false};
    int processId_{-1};
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::milliseconds cpuAtStart_{0};
    uint32_t networkRequests_{0};
    ExecutionMetrics last_;
};

/**
 * @brief Drives one Execute request to its terminal outcome
 *
 * Races the channel against the controller deadline. The deadline branch
 * kills the sandbox process through the lifecycle.
 */
class ExecutionSession {
public:
    ExecutionSession(ProcessLifecycle& lifecycle, MessageHandler& handler,
                     ExecutionTracker& tracker);

    /**
     * @return The result carried by Result/Error, or Timeout, Terminated,
     *         WorkerUnavailable or ProtocolError
     */
    [[nodiscard]] SandboxResult<ExecutionResult> run(const DispatchPlan& plan);

private:
    ProcessLifecycle& lifecycle_;
    MessageHandler& handler_;
    ExecutionTracker& tracker_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_EXECUTION_SESSION_HPP
