/*
 * execution_session.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "execution_session.hpp"
#include "resource_monitor.hpp"
#include "sanitizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <random>

namespace warden::sandbox {

namespace {
constexpr std::chrono::milliseconds kPollSlice{50};
}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

DispatchPlan prepareDispatch(std::string_view code,
                             const ExecutionContext& context,
                             const ResourceLimiter& limiter,
                             const config::SandboxConfig& config) {
    DispatchPlan plan;

    try {
        auto report = Sanitizer::sanitizeWithReport(code);
        plan.request.code = std::move(report.code);
        plan.warnings = report.warnings();
    } catch (const std::exception& e) {
        spdlog::error("Sanitizer failed, dropping the code: {}", e.what());
        plan.request.code = Sanitizer::sanitize(code);
        plan.warnings.push_back("Code removed: sanitizer failed");
    }

    auto limits = limiter.current();
    plan.request.context = limiter.mergeContext(context);
    plan.request.networkAccess = context.networkAccess;
    plan.request.memoryLimit = limits.memory;
    plan.request.cpuLimit = limits.cpu;
    plan.request.networkLimit = limits.network;
    plan.request.storageLimit = limits.storage;
    plan.request.executionTimeMs = limits.executionTime.count();
    plan.request.monitorIntervalMs = static_cast<int64_t>(config.monitorIntervalMs);
    plan.request.networkRequestCap = config.networkRequestCap;

    plan.timeout = context.timeout.value_or(
        std::chrono::milliseconds(config.defaultTimeoutMs));
    return plan;
}

uint32_t generateContextId() {
    static std::mutex mutex;
    static std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> distribution(1);

    std::lock_guard lock(mutex);
    return distribution(engine);
}

SandboxError describeFailure(SandboxErrorCode code,
                             std::chrono::milliseconds timeout) {
    switch (code) {
        case SandboxErrorCode::Timeout:
            return SandboxError(
                code, std::format("Execution timed out after {}ms: execution time "
                                  "limit exceeded",
                                  timeout.count()));
        case SandboxErrorCode::ProtocolError:
            return SandboxError(
                code, "Sandbox process exited without reporting a result");
        default:
            return SandboxError(code);
    }
}

std::future<ExecutionResult> rejectedFuture(const SandboxError& error) {
    std::promise<ExecutionResult> promise;
    promise.set_exception(std::make_exception_ptr(error));
    return promise.get_future();
}

// ============================================================================
// ExecutionControl
// ============================================================================

bool ExecutionControl::tryBegin() {
    bool expected = false;
    if (!executing_.compare_exchange_strong(expected, true)) {
        return false;
    }
    std::lock_guard lock(mutex_);
    inSession_ = false;
    pendingTermination_ = false;
    return true;
}

void ExecutionControl::enterSession(ProcessLifecycle& lifecycle) {
    std::lock_guard lock(mutex_);
    inSession_ = true;
    if (pendingTermination_) {
        pendingTermination_ = false;
        lifecycle.requestTermination();
    }
}

void ExecutionControl::leaveSession() {
    std::lock_guard lock(mutex_);
    inSession_ = false;
}

void ExecutionControl::finish() noexcept { executing_ = false; }

void ExecutionControl::terminate(ProcessLifecycle& lifecycle) {
    std::lock_guard lock(mutex_);
    if (!executing_) {
        return;
    }
    if (inSession_) {
        lifecycle.requestTermination();
    } else {
        pendingTermination_ = true;
    }
}

bool ExecutionControl::isExecuting() const noexcept { return executing_.load(); }

// ============================================================================
// ExecutionTracker
// ============================================================================

void ExecutionTracker::begin(int processId) {
    std::lock_guard lock(mutex_);
    active_ = true;
    processId_ = processId;
    startTime_ = std::chrono::steady_clock::now();
    cpuAtStart_ = ResourceMonitor::getCpuTime(processId).value_or(
        std::chrono::milliseconds{0});
    networkRequests_ = 0;
    last_ = ExecutionMetrics{};
}

void ExecutionTracker::recordNetworkRequest() {
    std::lock_guard lock(mutex_);
    ++networkRequests_;
}

void ExecutionTracker::finish(const ExecutionMetrics& metrics) {
    std::lock_guard lock(mutex_);
    active_ = false;
    last_ = metrics;
}

void ExecutionTracker::abandon() {
    std::lock_guard lock(mutex_);
    if (!active_) {
        return;
    }
    active_ = false;
    last_.executionTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_);
    last_.networkRequests = networkRequests_;
}

bool ExecutionTracker::isActive() const {
    std::lock_guard lock(mutex_);
    return active_;
}

ExecutionMetrics ExecutionTracker::snapshot() const {
    std::lock_guard lock(mutex_);
    if (!active_) {
        return last_;
    }

    ExecutionMetrics metrics;
    metrics.executionTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_);
    metrics.memoryUsage = ResourceMonitor::getMemoryUsage(processId_).value_or(0);
    if (auto cpu = ResourceMonitor::getCpuTime(processId_)) {
        metrics.cpuUsage =
            ResourceMonitor::cpuPercent(*cpu - cpuAtStart_, metrics.executionTime);
    }
    metrics.networkRequests = networkRequests_;
    return metrics;
}

// ============================================================================
// ExecutionSession
// ============================================================================

ExecutionSession::ExecutionSession(ProcessLifecycle& lifecycle,
                                   MessageHandler& handler,
                                   ExecutionTracker& tracker)
    : lifecycle_(lifecycle), handler_(handler), tracker_(tracker) {}

SandboxResult<ExecutionResult> ExecutionSession::run(const DispatchPlan& plan) {
    auto channel = lifecycle_.channel();
    if (!channel || !channel->isOpen()) {
        return std::unexpected(SandboxErrorCode::WorkerUnavailable);
    }
    const uint32_t contextId = channel->contextId();

    ExecutionResult result;
    result.warnings = plan.warnings;

    tracker_.begin(lifecycle_.processId());
    struct AbandonOnExit {
        ExecutionTracker& tracker;
        ~AbandonOnExit() { tracker.abandon(); }
    } abandonOnExit{tracker_};

    auto sent = channel->send(ipc::MessageType::Execute, plan.request.toJson());
    if (!sent) {
        spdlog::error("Failed to dispatch code to sandbox: {}",
                      ipc::ipcErrorToString(sent.error()));
        return std::unexpected(lifecycle_.isTerminationRequested()
                                   ? SandboxErrorCode::Terminated
                                   : SandboxErrorCode::WorkerUnavailable);
    }

    const auto deadline = std::chrono::steady_clock::now() + plan.timeout;

    while (true) {
        if (lifecycle_.isTerminationRequested()) {
            return std::unexpected(SandboxErrorCode::Terminated);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("Sandbox call exceeded its {}ms deadline",
                         plan.timeout.count());
            lifecycle_.requestTermination();
            return std::unexpected(SandboxErrorCode::Timeout);
        }

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto message = channel->receive(
            std::clamp(remaining, std::chrono::milliseconds{1}, kPollSlice));
        if (!message) {
            if (message.error() == ipc::IPCError::Timeout) {
                continue;
            }
            if (lifecycle_.isTerminationRequested()) {
                return std::unexpected(SandboxErrorCode::Terminated);
            }
            spdlog::error("Sandbox channel failed before a result: {}",
                          ipc::ipcErrorToString(message.error()));
            return std::unexpected(SandboxErrorCode::ProtocolError);
        }

        if (message->header.type == ipc::MessageType::NetworkRequest &&
            message->header.contextId == contextId) {
            tracker_.recordNetworkRequest();
        }

        auto handled = handler_.processMessage(*message, result, contextId);
        if (handled.reply) {
            if (auto replied = channel->send(*handled.reply); !replied) {
                spdlog::warn("Failed to answer sandbox {}: {}",
                             ipc::messageTypeName(message->header.type),
                             ipc::ipcErrorToString(replied.error()));
            }
        }

        if (handled.executionComplete) {
            tracker_.finish(result.metrics);
            return result;
        }
    }
}

}  // namespace warden::sandbox
