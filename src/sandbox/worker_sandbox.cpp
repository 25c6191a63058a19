/*
 * worker_sandbox.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "worker_sandbox.hpp"
#include "config_discovery.hpp"
#include "execution_session.hpp"
#include "lifecycle.hpp"
#include "message_handlers.hpp"
#include "process_spawning.hpp"
#include "resource_limiter.hpp"

#include "../ipc/message.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <mutex>
#include <system_error>

namespace warden::sandbox {

// ============================================================================
// WorkerSandbox::Impl
// ============================================================================

class WorkerSandbox::Impl {
public:
    explicit Impl(const config::SandboxConfig& config)
        : config_(config), limiter_(config.limits) {}

    void start() {
        if (auto valid = ConfigDiscovery::validateConfig(config_); !valid) {
            throw SandboxError(valid.error(), "Invalid sandbox configuration");
        }

        auto worker = ConfigDiscovery::findWorkerExecutable(config_);
        if (!worker) {
            throw SandboxError(SandboxErrorCode::WorkerUnavailable,
                               std::format("Sandbox worker executable '{}' not found",
                                           ConfigDiscovery::WORKER_NAME));
        }
        workerPath_ = *worker;

        if (auto ready = provision(); !ready) {
            throw SandboxError(
                SandboxErrorCode::WorkerUnavailable,
                std::format("Failed to start sandbox worker {}: {}",
                            workerPath_.string(), sandboxErrorToString(ready.error())));
        }
    }

    ExecutionResult run(const std::string& code, const ExecutionContext& context) {
        struct Release {
            ExecutionControl& control;
            ~Release() { control.finish(); }
        } release{control_};

        auto plan = prepareDispatch(code, context, limiter_, config_);

        lifecycle_.resetTermination();
        if (!lifecycle_.isAttached()) {
            if (auto ready = provision(); !ready) {
                throw describeFailure(SandboxErrorCode::WorkerUnavailable,
                                      plan.timeout);
            }
        }

        MessageHandler handler;
        {
            std::lock_guard lock(callbackMutex_);
            handler.setConsoleCallback(consoleCallback_);
            handler.setNetworkHandler(networkHandler_);
        }

        ExecutionSession session(lifecycle_, handler, tracker_);
        SandboxResult<ExecutionResult> outcome;
        {
            // The worker is retired even when the session unwinds, so a
            // half-finished run can never answer the next call
            struct SessionScope {
                Impl& impl;
                ~SessionScope() {
                    impl.control_.leaveSession();
                    impl.recycle();
                }
            } scope{*this};

            control_.enterSession(lifecycle_);
            outcome = session.run(plan);
        }

        if (!outcome) {
            spdlog::info("Sandbox call failed: {}", sandboxErrorToString(outcome.error()));
            throw describeFailure(outcome.error(), plan.timeout);
        }
        return std::move(*outcome);
    }

    SandboxResult<void> provision() {
        auto channel = std::make_shared<ipc::BidirectionalChannel>();
        if (auto created = channel->create(); !created) {
            spdlog::error("Failed to create worker channel: {}",
                          ipc::ipcErrorToString(created.error()));
            return std::unexpected(SandboxErrorCode::SpawnFailed);
        }
        channel->setContextId(generateContextId());

        auto pid = ProcessSpawner::spawnWorker(workerPath_, channel->getSubprocessFds(),
                                               config_.effectiveWorkingDirectory());
        if (!pid) {
            return std::unexpected(pid.error());
        }
        channel->setupParent();
        lifecycle_.attach(*pid, channel);

        auto greeting = channel->performHandshake(
            std::chrono::milliseconds(config_.handshakeTimeoutMs));
        if (!greeting) {
            spdlog::error("Worker {} did not complete the handshake: {}", *pid,
                          ipc::ipcErrorToString(greeting.error()));
            lifecycle_.shutdown();
            return std::unexpected(SandboxErrorCode::HandshakeFailed);
        }
        if (static_cast<int>(greeting->pid) != *pid) {
            spdlog::error("Handshake answered by PID {}, expected {}",
                          greeting->pid, *pid);
            lifecycle_.shutdown();
            return std::unexpected(SandboxErrorCode::HandshakeFailed);
        }

        spdlog::debug("Worker {} ready (Python {}, context {})", *pid,
                      greeting->pythonVersion, channel->contextId());
        return {};
    }

    /// Stop the worker that served a call; the next call starts a fresh one
    void recycle() { lifecycle_.shutdown(); }

    config::SandboxConfig config_;
    std::filesystem::path workerPath_;
    ResourceLimiter limiter_;
    ProcessLifecycle lifecycle_;
    ExecutionTracker tracker_;
    ExecutionControl control_;

    std::mutex callbackMutex_;
    ConsoleCallback consoleCallback_;
    NetworkHandler networkHandler_;
};

// ============================================================================
// WorkerSandbox
// ============================================================================

WorkerSandbox::WorkerSandbox(const config::SandboxConfig& config)
    : pImpl_(std::make_shared<Impl>(config)) {
    pImpl_->start();
}

WorkerSandbox::~WorkerSandbox() {
    if (pImpl_) {
        pImpl_->control_.terminate(pImpl_->lifecycle_);
    }
}

std::future<ExecutionResult> WorkerSandbox::executeCode(
    std::string_view code, const ExecutionContext& context) {
    if (!pImpl_->control_.tryBegin()) {
        return rejectedFuture(SandboxError(SandboxErrorCode::AlreadyExecuting));
    }

    auto impl = pImpl_;
    try {
        return std::async(std::launch::async,
                          [impl, source = std::string(code), context] {
                              return impl->run(source, context);
                          });
    } catch (const std::system_error& e) {
        impl->control_.finish();
        spdlog::error("Failed to start sandbox call: {}", e.what());
        return rejectedFuture(SandboxError(SandboxErrorCode::UnknownError, e.what()));
    }
}

void WorkerSandbox::limitResources(const ResourceLimitsPatch& limits) {
    pImpl_->limiter_.apply(limits);
}

ExecutionMetrics WorkerSandbox::monitorExecution() const {
    return pImpl_->tracker_.snapshot();
}

void WorkerSandbox::terminateExecution() {
    pImpl_->control_.terminate(pImpl_->lifecycle_);
}

ResourceLimits WorkerSandbox::limits() const { return pImpl_->limiter_.current(); }

bool WorkerSandbox::isExecuting() const noexcept {
    return pImpl_->control_.isExecuting();
}

void WorkerSandbox::setConsoleCallback(ConsoleCallback callback) {
    std::lock_guard lock(pImpl_->callbackMutex_);
    pImpl_->consoleCallback_ = std::move(callback);
}

void WorkerSandbox::setNetworkHandler(NetworkHandler handler) {
    std::lock_guard lock(pImpl_->callbackMutex_);
    pImpl_->networkHandler_ = std::move(handler);
}

int WorkerSandbox::workerProcessId() const {
    return pImpl_->lifecycle_.processId();
}

}  // namespace warden::sandbox
