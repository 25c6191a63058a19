/*
 * message_handlers.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_MESSAGE_HANDLERS_HPP
#define WARDEN_SANDBOX_MESSAGE_HANDLERS_HPP

#include "../ipc/message.hpp"
#include "types.hpp"

#include <optional>

namespace warden::sandbox {

/**
 * @brief Handler result after processing a message
 */
struct MessageHandlerResult {
    bool shouldContinue{true};          ///< Continue waiting for messages
    bool executionComplete{false};      ///< A terminal message was consumed
    std::optional<ipc::Message> reply;  ///< Message to send back to the sandbox
};

/**
 * @brief Controller-side dispatch of messages coming out of a sandbox
 */
class MessageHandler {
public:
    /**
     * @brief Set console callback
     */
    void setConsoleCallback(ConsoleCallback callback);

    /**
     * @brief Set the handler serving guest fetch calls
     *
     * An empty handler restores the default, which denies every request.
     */
    void setNetworkHandler(NetworkHandler handler);

    /**
     * @brief Process an incoming IPC message
     * @param message Message to process
     * @param currentResult Result of the call being built up
     * @param expectedContextId Context the call was dispatched to
     * @return Handler result indicating what to do next
     */
    [[nodiscard]] MessageHandlerResult processMessage(
        const ipc::Message& message,
        ExecutionResult& currentResult,
        uint32_t expectedContextId);

private:
    [[nodiscard]] MessageHandlerResult handleTerminal(
        const json& payload, ExecutionResult& result, bool isError);

    [[nodiscard]] MessageHandlerResult handleLog(
        const json& payload, ExecutionResult& result);

    [[nodiscard]] MessageHandlerResult handleDiagnostic(
        const json& payload, ExecutionResult& result);

    [[nodiscard]] MessageHandlerResult handleNetworkRequest(
        const ipc::Message& message, const json& payload);

    ConsoleCallback consoleCallback_;
    NetworkHandler networkHandler_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_MESSAGE_HANDLERS_HPP
