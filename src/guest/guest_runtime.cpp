/*
 * guest_runtime.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "guest_runtime.hpp"
#include "interpreter.hpp"
#include "process_hardening.hpp"
#include "script_host.hpp"
#include "../sandbox/metrics_monitor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <format>

#include <unistd.h>

namespace warden::guest {

namespace {

constexpr std::chrono::milliseconds kIdlePoll{1000};

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void fillMetrics(ipc::ExecuteResult& report,
                 const sandbox::ExecutionMetrics& metrics,
                 uint64_t networkBytes) {
    report.executionTimeMs = metrics.executionTime.count();
    report.memoryUsage = metrics.memoryUsage;
    report.cpuUsage = metrics.cpuUsage;
    report.networkRequests = metrics.networkRequests;
    report.networkBytes = networkBytes;
}

}  // namespace

class GuestRuntime::Impl {
public:
    Impl(ipc::BidirectionalChannel& channel, GuestRuntimeOptions options)
        : channel_(channel), options_(options) {}

    int serve() {
        while (true) {
            auto message = channel_.receive(kIdlePoll);
            if (!message) {
                if (message.error() == ipc::IPCError::Timeout) {
                    continue;
                }
                if (message.error() == ipc::IPCError::ChannelClosed) {
                    spdlog::debug("Controller closed the channel");
                    return 0;
                }
                spdlog::error("Sandbox receive failed: {}",
                              ipc::ipcErrorToString(message.error()));
                return 1;
            }

            switch (message->header.type) {
                case ipc::MessageType::Handshake:
                    if (!answerHandshake(*message)) {
                        return 1;
                    }
                    break;

                case ipc::MessageType::Execute:
                    if (message->header.contextId != channel_.contextId()) {
                        spdlog::warn("Ignoring Execute for context {}",
                                     message->header.contextId);
                        break;
                    }
                    handleExecute(*message);
                    if (options_.singleShot) {
                        return 0;
                    }
                    break;

                case ipc::MessageType::Shutdown:
                    spdlog::debug("Shutdown requested");
                    return 0;

                default:
                    spdlog::warn("Unexpected {} message in sandbox",
                                 ipc::messageTypeName(message->header.type));
                    break;
            }
        }
    }

    void execute(const ipc::ExecuteRequest& request) {
        sandbox::ResourceLimits limits;
        limits.memory = request.memoryLimit;
        limits.cpu = request.cpuLimit;
        limits.network = request.networkLimit;
        limits.storage = request.storageLimit;
        limits.executionTime = std::chrono::milliseconds(request.executionTimeMs);

        ExecutionLimits kernelLimits;
        kernelLimits.memory = request.memoryLimit;
        kernelLimits.storage = request.storageLimit;
        if (options_.cpuBackstop) {
            kernelLimits.cpuTime = limits.executionTime;
        }
        if (auto applied = applyExecutionLimits(kernelLimits); !applied) {
            spdlog::warn("Execution limits not applied: {}",
                         sandbox::sandboxErrorToString(applied.error()));
        }

        sandbox::TerminalGate gate;
        sandbox::MetricsMonitor monitor(
            limits, std::chrono::milliseconds(
                        std::max<int64_t>(1, request.monitorIntervalMs)));

        GuestBridge bridge;
        bridge.console = [this](std::string_view level, std::string_view text) {
            sendLog(level, text);
        };
        bridge.fetch = [this](const sandbox::NetworkRequest& outbound) {
            return relayFetch(outbound);
        };
        bridge.diagnostic = [this](std::string_view error, std::string_view stack) {
            sendDiagnostic(error, stack);
        };

        ScriptHostOptions hostOptions;
        hostOptions.networkRequestCap = request.networkRequestCap;
        hostOptions.networkAccess = request.networkAccess;
        ScriptHost host(std::move(bridge), monitor, hostOptions);

        monitor.start([this, &gate, &monitor](sandbox::LimitViolation violation,
                                              const sandbox::ExecutionMetrics& metrics) {
            if (!gate.claim()) {
                return;
            }
            ipc::ExecuteResult failure;
            failure.success = false;
            failure.error = std::string(sandbox::limitViolationToString(violation));
            fillMetrics(failure, metrics, monitor.networkBytes());
            if (auto sent = channel_.send(ipc::MessageType::Error, failure.toJson());
                !sent) {
                spdlog::error("Failed to report limit violation: {}",
                              ipc::ipcErrorToString(sent.error()));
            }
            // The guest may be stuck in a loop the interpreter cannot leave
            std::_Exit(0);
        });

        auto outcome = host.run(request.code, request.context);

        if (!gate.claim()) {
            // The monitor reported first and is ending the process
            monitor.stop();
            std::_Exit(0);
        }
        monitor.stop();

        auto metrics = monitor.snapshot();

        ipc::ExecuteResult report;
        report.success = outcome.success;
        report.result = outcome.success ? outcome.result : json();
        report.error = outcome.error;
        report.stack = outcome.stack;
        fillMetrics(report, metrics, monitor.networkBytes());

        if (limits.cpu > 0 && metrics.cpuUsage > limits.cpu) {
            report.warnings.push_back(
                std::format("CPU usage {:.0f}% exceeded advisory limit {}%",
                            metrics.cpuUsage, limits.cpu));
        }
        if (limits.network > 0 && monitor.networkBytes() > limits.network) {
            report.warnings.push_back(
                std::format("Network usage {} bytes exceeded advisory budget {} bytes",
                            monitor.networkBytes(), limits.network));
        }

        if (outcome.networkLimitHit) {
            report.success = false;
            report.result = json();
            report.error = std::string(sandbox::limitViolationToString(
                sandbox::LimitViolation::NetworkRequests));
        }

        auto type = report.success ? ipc::MessageType::Result : ipc::MessageType::Error;
        if (auto sent = channel_.send(type, report.toJson()); !sent) {
            spdlog::error("Failed to report execution result: {}",
                          ipc::ipcErrorToString(sent.error()));
        }
    }

private:
    bool answerHandshake(const ipc::Message& message) {
        auto payload = message.getPayloadAsJson();
        if (!payload) {
            return false;
        }
        auto greeting = ipc::HandshakePayload::fromJson(*payload);
        if (!greeting) {
            return false;
        }

        channel_.setContextId(greeting->contextId);

        ipc::HandshakePayload ack;
        ack.version = std::string(ipc::ProtocolConstants::VERSION_STRING);
        ack.pythonVersion = InterpreterScope::pythonVersion();
        ack.capabilities = {"execute", "console", "fetch"};
        ack.pid = static_cast<uint32_t>(::getpid());
        ack.contextId = greeting->contextId;

        auto sent = channel_.respondToHandshake(ack);
        if (!sent) {
            spdlog::error("Handshake reply failed: {}",
                          ipc::ipcErrorToString(sent.error()));
            return false;
        }
        spdlog::debug("Handshake complete for context {}", ack.contextId);
        return true;
    }

    void handleExecute(const ipc::Message& message) {
        ipc::IPCResult<ipc::ExecuteRequest> request =
            std::unexpected(ipc::IPCError::InvalidMessage);
        if (auto payload = message.getPayloadAsJson()) {
            request = ipc::ExecuteRequest::fromJson(*payload);
        }
        if (!request) {
            ipc::ExecuteResult failure;
            failure.success = false;
            failure.error = "Malformed execute request";
            if (auto sent = channel_.send(ipc::MessageType::Error, failure.toJson());
                !sent) {
                spdlog::error("Failed to reject execute request: {}",
                              ipc::ipcErrorToString(sent.error()));
            }
            return;
        }
        execute(*request);
    }

    void sendLog(std::string_view level, std::string_view text) {
        ipc::LogRecord record{std::string(level), std::string(text), nowMs()};
        if (auto sent = channel_.send(ipc::MessageType::Log, record.toJson()); !sent) {
            spdlog::debug("Console line dropped: {}",
                          ipc::ipcErrorToString(sent.error()));
        }
    }

    void sendDiagnostic(std::string_view error, std::string_view stack) {
        ipc::DiagnosticReport report;
        report.error = std::string(error);
        if (!stack.empty()) {
            report.stack = std::string(stack);
        }
        if (auto sent = channel_.send(ipc::MessageType::Diagnostic, report.toJson());
            !sent) {
            spdlog::debug("Diagnostic dropped: {}",
                          ipc::ipcErrorToString(sent.error()));
        }
    }

    std::optional<sandbox::NetworkResponse> relayFetch(
        const sandbox::NetworkRequest& outbound) {
        uint32_t requestId = ++requestSequence_;

        ipc::NetworkRequestPayload payload{outbound.url, outbound.method,
                                           outbound.headers, outbound.body};
        auto message = ipc::Message::create(ipc::MessageType::NetworkRequest,
                                            payload.toJson(), requestId,
                                            channel_.contextId());
        if (auto sent = channel_.send(message); !sent) {
            spdlog::error("Network relay failed: {}",
                          ipc::ipcErrorToString(sent.error()));
            return std::nullopt;
        }

        while (true) {
            auto reply = channel_.receive(kIdlePoll);
            if (!reply) {
                if (reply.error() == ipc::IPCError::Timeout) {
                    continue;
                }
                return std::nullopt;
            }
            if (reply->header.type == ipc::MessageType::Shutdown) {
                std::_Exit(0);
            }
            if (reply->header.type != ipc::MessageType::NetworkResponse ||
                reply->header.sequenceId != requestId) {
                spdlog::debug("Skipping {} while waiting for network reply",
                              ipc::messageTypeName(reply->header.type));
                continue;
            }

            auto body = reply->getPayloadAsJson();
            if (!body) {
                return std::nullopt;
            }
            auto parsed = ipc::NetworkResponsePayload::fromJson(*body);
            if (!parsed) {
                return std::nullopt;
            }
            return sandbox::NetworkResponse{parsed->ok, parsed->status,
                                            parsed->headers, parsed->body,
                                            parsed->error};
        }
    }

    ipc::BidirectionalChannel& channel_;
    GuestRuntimeOptions options_;
    std::atomic<uint32_t> requestSequence_{0};
};

GuestRuntime::GuestRuntime(ipc::BidirectionalChannel& channel,
                           GuestRuntimeOptions options)
    : pImpl_(std::make_unique<Impl>(channel, options)) {}

GuestRuntime::~GuestRuntime() = default;

int GuestRuntime::serve() { return pImpl_->serve(); }

void GuestRuntime::execute(const ipc::ExecuteRequest& request) {
    pImpl_->execute(request);
}

}  // namespace warden::guest
