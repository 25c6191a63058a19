/*
 * message_types.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file message_types.hpp
 * @brief Controller/sandbox protocol type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_IPC_MESSAGE_TYPES_HPP
#define WARDEN_IPC_MESSAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace warden::ipc {

/**
 * @brief IPC error codes
 */
enum class IPCError {
    Success = 0,
    ConnectionFailed,
    MessageTooLarge,
    SerializationFailed,
    DeserializationFailed,
    Timeout,
    PipeError,
    InvalidMessage,
    ChannelClosed,
    HandshakeRejected,
    UnknownError
};

/**
 * @brief Get string representation of IPCError
 */
[[nodiscard]] constexpr std::string_view ipcErrorToString(IPCError error) noexcept {
    switch (error) {
        case IPCError::Success: return "Success";
        case IPCError::ConnectionFailed: return "Connection failed";
        case IPCError::MessageTooLarge: return "Message too large";
        case IPCError::SerializationFailed: return "Serialization failed";
        case IPCError::DeserializationFailed: return "Deserialization failed";
        case IPCError::Timeout: return "Timeout";
        case IPCError::PipeError: return "Pipe error";
        case IPCError::InvalidMessage: return "Invalid message";
        case IPCError::ChannelClosed: return "Channel closed";
        case IPCError::HandshakeRejected: return "Handshake rejected";
        case IPCError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for IPC operations
 */
template<typename T>
using IPCResult = std::expected<T, IPCError>;

/**
 * @brief Message types exchanged between the controller and a sandbox
 */
enum class MessageType : uint8_t {
    // Control messages (0x01-0x0F)
    Handshake = 0x01,        ///< Controller greets a freshly spawned worker
    HandshakeAck = 0x02,     ///< Worker identifies itself
    Shutdown = 0x03,         ///< Terminate: forces shutdown, no reply

    // Execution messages (0x10-0x1F)
    Execute = 0x10,          ///< Run a code string
    Result = 0x11,           ///< Terminal: success
    Error = 0x12,            ///< Terminal: failure

    // Observation messages (0x20-0x2F)
    Log = 0x20,              ///< Forwarded console line
    Diagnostic = 0x21,       ///< Unhandled error not tied to the current call

    // Network relay (0x30-0x3F)
    NetworkRequest = 0x30,   ///< Guest fetch forwarded to the controller
    NetworkResponse = 0x31   ///< Controller answer to a fetch
};

/**
 * @brief Get string name for message type
 */
[[nodiscard]] constexpr std::string_view messageTypeName(MessageType type) noexcept {
    switch (type) {
        case MessageType::Handshake: return "Handshake";
        case MessageType::HandshakeAck: return "HandshakeAck";
        case MessageType::Shutdown: return "Shutdown";
        case MessageType::Execute: return "Execute";
        case MessageType::Result: return "Result";
        case MessageType::Error: return "Error";
        case MessageType::Log: return "Log";
        case MessageType::Diagnostic: return "Diagnostic";
        case MessageType::NetworkRequest: return "NetworkRequest";
        case MessageType::NetworkResponse: return "NetworkResponse";
    }
    return "Unknown";
}

/**
 * @brief Check if message type is a control message
 */
[[nodiscard]] constexpr bool isControlMessage(MessageType type) noexcept {
    return static_cast<uint8_t>(type) >= 0x01 &&
           static_cast<uint8_t>(type) <= 0x0F;
}

/**
 * @brief Check if message type ends an execution
 */
[[nodiscard]] constexpr bool isTerminalMessage(MessageType type) noexcept {
    return type == MessageType::Result || type == MessageType::Error;
}

/**
 * @brief Protocol constants
 */
struct ProtocolConstants {
    static constexpr uint32_t MAGIC = 0x5752444E;  // "WRDN"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 20;
    static constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;  // 64MB
    static constexpr std::string_view VERSION_STRING = "1.0";
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_MESSAGE_TYPES_HPP
