/*
 * message_handlers.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "message_handlers.hpp"
#include "../logging/logger.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace warden::sandbox {

namespace {

spdlog::level::level_enum consoleLevel(std::string_view level) {
    if (level == "error") return spdlog::level::err;
    if (level == "warn") return spdlog::level::warn;
    if (level == "debug") return spdlog::level::debug;
    return spdlog::level::info;
}

std::chrono::system_clock::time_point fromEpochMs(int64_t ms) {
    if (ms <= 0) {
        return std::chrono::system_clock::now();
    }
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

}  // namespace

void MessageHandler::setConsoleCallback(ConsoleCallback callback) {
    consoleCallback_ = std::move(callback);
}

void MessageHandler::setNetworkHandler(NetworkHandler handler) {
    networkHandler_ = std::move(handler);
}

MessageHandlerResult MessageHandler::processMessage(
    const ipc::Message& message, ExecutionResult& currentResult,
    uint32_t expectedContextId) {
    if (message.header.contextId != expectedContextId) {
        spdlog::warn("Discarding {} message from foreign context {} (expected {})",
                     ipc::messageTypeName(message.header.type),
                     message.header.contextId, expectedContextId);
        return {};
    }

    auto payloadResult = message.getPayloadAsJson();
    if (!payloadResult) {
        spdlog::warn("Discarding undecodable {} message",
                     ipc::messageTypeName(message.header.type));
        return {};
    }

    const auto& payload = *payloadResult;

    switch (message.header.type) {
        case ipc::MessageType::Result:
            return handleTerminal(payload, currentResult, false);

        case ipc::MessageType::Error:
            return handleTerminal(payload, currentResult, true);

        case ipc::MessageType::Log:
            return handleLog(payload, currentResult);

        case ipc::MessageType::Diagnostic:
            return handleDiagnostic(payload, currentResult);

        case ipc::MessageType::NetworkRequest:
            return handleNetworkRequest(message, payload);

        default:
            spdlog::warn("Unexpected message type: {}",
                         ipc::messageTypeName(message.header.type));
            return {};
    }
}

MessageHandlerResult MessageHandler::handleTerminal(const json& payload,
                                                    ExecutionResult& result,
                                                    bool isError) {
    auto execResult = ipc::ExecuteResult::fromJson(payload);
    if (execResult) {
        result.success = !isError && execResult->success;
        result.output = execResult->result;
        result.error = execResult->error;
        result.stack = execResult->stack;
        result.metrics.executionTime =
            std::chrono::milliseconds(execResult->executionTimeMs);
        result.metrics.memoryUsage = execResult->memoryUsage;
        result.metrics.cpuUsage = execResult->cpuUsage;
        result.metrics.networkRequests = execResult->networkRequests;
        result.warnings.insert(result.warnings.end(),
                               execResult->warnings.begin(),
                               execResult->warnings.end());
        if (!result.success && result.error.empty()) {
            result.error = "Unknown error";
        }
    } else {
        result.success = false;
        result.error = "Malformed result from sandbox";
    }

    MessageHandlerResult handlerResult;
    handlerResult.shouldContinue = false;
    handlerResult.executionComplete = true;
    return handlerResult;
}

MessageHandlerResult MessageHandler::handleLog(const json& payload,
                                               ExecutionResult& result) {
    auto record = ipc::LogRecord::fromJson(payload);
    if (record) {
        ConsoleEntry entry{record->level, record->message,
                           fromEpochMs(record->timestamp)};

        logging::getLogger("sandbox.console")
            ->log(consoleLevel(entry.level), "{}", entry.message);

        if (consoleCallback_) {
            try {
                consoleCallback_(entry);
            } catch (const std::exception& e) {
                spdlog::error("Console callback failed: {}", e.what());
            }
        }
        result.logs.push_back(std::move(entry));
    }
    return {};
}

MessageHandlerResult MessageHandler::handleDiagnostic(const json& payload,
                                                      ExecutionResult& result) {
    auto report = ipc::DiagnosticReport::fromJson(payload);
    if (report) {
        spdlog::warn("Unhandled error in sandbox: {}", report->error);
        if (report->stack) {
            spdlog::debug("{}", *report->stack);
        }
        result.warnings.push_back("Unhandled error in sandbox: " + report->error);
    }
    return {};
}

MessageHandlerResult MessageHandler::handleNetworkRequest(
    const ipc::Message& message, const json& payload) {
    NetworkResponse response;

    auto request = ipc::NetworkRequestPayload::fromJson(payload);
    if (!request) {
        response.error = "Malformed network request";
    } else {
        NetworkRequest outbound{request->url, request->method,
                                request->headers, request->body};
        try {
            response = networkHandler_ ? networkHandler_(outbound)
                                       : denyNetworkRequest(outbound);
        } catch (const std::exception& e) {
            spdlog::error("Network handler failed for {}: {}", outbound.url,
                          e.what());
            response = NetworkResponse{};
            response.error = e.what();
        }
    }

    ipc::NetworkResponsePayload reply{response.ok, response.status,
                                      response.headers, response.body,
                                      response.error};

    MessageHandlerResult handlerResult;
    handlerResult.reply = ipc::Message::create(
        ipc::MessageType::NetworkResponse, reply.toJson(),
        message.header.sequenceId, message.header.contextId);
    return handlerResult;
}

}  // namespace warden::sandbox
