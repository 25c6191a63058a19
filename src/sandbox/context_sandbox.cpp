/*
 * context_sandbox.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "context_sandbox.hpp"
#include "execution_session.hpp"
#include "lifecycle.hpp"
#include "message_handlers.hpp"
#include "process_spawning.hpp"
#include "resource_limiter.hpp"

#include "../guest/guest_runtime.hpp"
#include "../guest/interpreter.hpp"
#include "../guest/process_hardening.hpp"
#include "../guest/script_host.hpp"
#include "../ipc/message.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <system_error>

namespace warden::sandbox {

namespace {

/**
 * Body of the forked context. Runs in a copy of a possibly multi-threaded
 * process, so it logs nothing and only touches state it owns.
 */
int runContext(ipc::BidirectionalChannel& channel,
               const std::filesystem::path& workingDirectory) {
    if (auto* logger = spdlog::default_logger_raw()) {
        logger->set_level(spdlog::level::off);
    }

    channel.setupChild();
    auto [readFd, writeFd] = channel.getSubprocessFds();
    guest::closeInheritedDescriptors({readFd, writeFd});

    guest::HardeningOptions hardening;
    hardening.parentDeathSignal = true;
    hardening.workingDirectory = workingDirectory;
    if (auto hardened = guest::applyBaseline(hardening); !hardened) {
        return 1;
    }

    guest::InterpreterScope interpreter;
    guest::ScriptHost::preloadModules();

    guest::GuestRuntimeOptions options;
    options.singleShot = true;
    options.cpuBackstop = true;
    guest::GuestRuntime runtime(channel, options);
    return runtime.serve();
}

}  // namespace

// ============================================================================
// ContextSandbox::Impl
// ============================================================================

class ContextSandbox::Impl {
public:
    explicit Impl(const config::SandboxConfig& config)
        : config_(config), limiter_(config.limits) {}

    ExecutionResult run(const std::string& code, const ExecutionContext& context) {
        struct Release {
            ExecutionControl& control;
            ~Release() { control.finish(); }
        } release{control_};

        auto plan = prepareDispatch(code, context, limiter_, config_);

        auto channel = std::make_shared<ipc::BidirectionalChannel>();
        if (auto created = channel->create(); !created) {
            spdlog::error("Failed to create context channel: {}",
                          ipc::ipcErrorToString(created.error()));
            throw describeFailure(SandboxErrorCode::SpawnFailed, plan.timeout);
        }
        channel->setContextId(generateContextId());

        auto workingDirectory = config_.effectiveWorkingDirectory();
        SandboxResult<int> pid = std::unexpected(SandboxErrorCode::SpawnFailed);
        {
            guest::InterpreterForkGuard forkGuard;
            pid = ProcessSpawner::forkChild([&]() {
                forkGuard.afterForkChild();
                return runContext(*channel, workingDirectory);
            });
            forkGuard.afterForkParent();
        }
        if (!pid) {
            throw describeFailure(pid.error(), plan.timeout);
        }

        channel->setupParent();
        lifecycle_.resetTermination();
        lifecycle_.attach(*pid, channel);

        MessageHandler handler;
        {
            std::lock_guard lock(callbackMutex_);
            handler.setConsoleCallback(consoleCallback_);
            handler.setNetworkHandler(networkHandler_);
        }

        SandboxResult<ExecutionResult> outcome;
        {
            struct SessionScope {
                Impl& impl;
                ~SessionScope() {
                    impl.control_.leaveSession();
                    impl.lifecycle_.shutdown();
                }
            } scope{*this};

            control_.enterSession(lifecycle_);
            if (auto greeted = greet(*channel, *pid); greeted) {
                ExecutionSession session(lifecycle_, handler, tracker_);
                outcome = session.run(plan);
            } else {
                outcome = std::unexpected(greeted.error());
            }
        }

        if (!outcome) {
            spdlog::info("Sandbox call failed: {}", sandboxErrorToString(outcome.error()));
            throw describeFailure(outcome.error(), plan.timeout);
        }
        return std::move(*outcome);
    }

    SandboxResult<void> greet(ipc::BidirectionalChannel& channel, int pid) {
        auto greeting = channel.performHandshake(
            std::chrono::milliseconds(config_.handshakeTimeoutMs));
        if (greeting && static_cast<int>(greeting->pid) == pid) {
            return {};
        }
        if (lifecycle_.isTerminationRequested()) {
            return std::unexpected(SandboxErrorCode::Terminated);
        }
        if (!greeting) {
            spdlog::error("Context {} did not complete the handshake: {}", pid,
                          ipc::ipcErrorToString(greeting.error()));
        } else {
            spdlog::error("Handshake answered by PID {}, expected {}",
                          greeting->pid, pid);
        }
        return std::unexpected(SandboxErrorCode::HandshakeFailed);
    }

    config::SandboxConfig config_;
    ResourceLimiter limiter_;
    ProcessLifecycle lifecycle_;
    ExecutionTracker tracker_;
    ExecutionControl control_;

    std::mutex callbackMutex_;
    ConsoleCallback consoleCallback_;
    NetworkHandler networkHandler_;
};

// ============================================================================
// ContextSandbox
// ============================================================================

ContextSandbox::ContextSandbox(const config::SandboxConfig& config)
    : pImpl_(std::make_shared<Impl>(config)) {
    if (auto valid = config.validate(); !valid) {
        throw SandboxError(valid.error(), "Invalid sandbox configuration");
    }
}

ContextSandbox::~ContextSandbox() {
    if (pImpl_) {
        pImpl_->control_.terminate(pImpl_->lifecycle_);
    }
}

std::future<ExecutionResult> ContextSandbox::executeCode(
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

void ContextSandbox::limitResources(const ResourceLimitsPatch& limits) {
    pImpl_->limiter_.apply(limits);
}

ExecutionMetrics ContextSandbox::monitorExecution() const {
    return pImpl_->tracker_.snapshot();
}

void ContextSandbox::terminateExecution() {
    pImpl_->control_.terminate(pImpl_->lifecycle_);
}

ResourceLimits ContextSandbox::limits() const { return pImpl_->limiter_.current(); }

bool ContextSandbox::isExecuting() const noexcept {
    return pImpl_->control_.isExecuting();
}

void ContextSandbox::setConsoleCallback(ConsoleCallback callback) {
    std::lock_guard lock(pImpl_->callbackMutex_);
    pImpl_->consoleCallback_ = std::move(callback);
}

void ContextSandbox::setNetworkHandler(NetworkHandler handler) {
    std::lock_guard lock(pImpl_->callbackMutex_);
    pImpl_->networkHandler_ = std::move(handler);
}

}  // namespace warden::sandbox
