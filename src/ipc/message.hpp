/*
 * message.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file message.hpp
 * @brief Framed protocol messages and their payloads
 * @date 2024
 * @version 1.0.0
 *
 * Every message between the controller and an isolated context is a
 * fixed-size big-endian header followed by a MessagePack payload:
 * - MessageHeader carries magic, version, type, sizes and the id of the
 *   context that produced it, so stale or foreign traffic can be dropped
 * - Message is the generic container
 * - The payload structures below are the typed views used on each side
 */

#ifndef WARDEN_IPC_MESSAGE_HPP
#define WARDEN_IPC_MESSAGE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "message_types.hpp"

namespace warden::ipc {

using json = nlohmann::json;

/**
 * @brief Message header structure
 *
 * Layout (20 bytes): magic(4) version(1) type(1) flags(1) reserved(1)
 * payloadSize(4) sequenceId(4) contextId(4).
 */
struct MessageHeader {
    static constexpr uint32_t MAGIC = ProtocolConstants::MAGIC;
    static constexpr uint8_t VERSION = ProtocolConstants::VERSION;
    static constexpr size_t SIZE = ProtocolConstants::HEADER_SIZE;

    uint32_t magic{MAGIC};     ///< Magic number for validation
    uint8_t version{VERSION};  ///< Protocol version
    MessageType type{MessageType::Log};  ///< Message type
    uint8_t flags{0};          ///< Message flags
    uint8_t reserved{0};       ///< Reserved for future use
    uint32_t payloadSize{0};   ///< Size of payload in bytes
    uint32_t sequenceId{0};    ///< Message sequence number
    uint32_t contextId{0};     ///< Isolated context that owns the message

    /**
     * @brief Serialize header to bytes
     */
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize header from bytes
     * @param data Byte buffer to deserialize from
     * @return Deserialized header or error
     */
    [[nodiscard]] static IPCResult<MessageHeader> deserialize(
        std::span<const uint8_t> data);

    /**
     * @brief Validate the header
     * @return True if magic and version match and the payload fits
     */
    [[nodiscard]] bool isValid() const noexcept;
};

/**
 * @brief IPC Message structure
 */
struct Message {
    MessageHeader header;
    std::vector<uint8_t> payload;

    /**
     * @brief Create a message with a JSON payload
     * @param type Message type
     * @param payload JSON payload to serialize
     * @param sequenceId Optional sequence ID
     * @param contextId Owning context
     */
    [[nodiscard]] static Message create(MessageType type, const json& payload,
                                        uint32_t sequenceId = 0,
                                        uint32_t contextId = 0);

    /**
     * @brief Get payload as JSON
     * @return Deserialized JSON or error
     */
    [[nodiscard]] IPCResult<json> getPayloadAsJson() const;

    /**
     * @brief Serialize the entire message (header + payload)
     */
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize a message from bytes
     */
    [[nodiscard]] static IPCResult<Message> deserialize(
        std::span<const uint8_t> data);
};

/**
 * @brief Execute request payload
 *
 * The merged context and the resource limits that the isolated side
 * enforces on itself.
 */
struct ExecuteRequest {
    std::string code;                  ///< Sanitized code
    json context = json::object();     ///< Caller context merged with limits
    bool networkAccess{true};          ///< Whether fetch may leave the sandbox
    uint64_t memoryLimit{0};           ///< Bytes, 0 = unlimited
    int cpuLimit{0};                   ///< Percent ceiling, advisory
    uint64_t networkLimit{0};          ///< Byte budget, advisory
    uint64_t storageLimit{0};          ///< Byte budget for written files
    int64_t executionTimeMs{0};        ///< Wall clock budget, 0 = unlimited
    int64_t monitorIntervalMs{100};    ///< Sampling period of the monitor
    uint32_t networkRequestCap{10};    ///< Fetch calls allowed per run

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ExecuteRequest> fromJson(const json& j);
};

/**
 * @brief Terminal payload for both Result and Error messages
 */
struct ExecuteResult {
    bool success{false};               ///< Whether execution succeeded
    json result;                       ///< Return value (success)
    std::string error;                 ///< "Type: message" (failure)
    std::optional<std::string> stack;  ///< Formatted traceback
    int64_t executionTimeMs{0};        ///< Time spent running guest code
    uint64_t memoryUsage{0};           ///< Peak sampled resident memory
    double cpuUsage{0.0};              ///< CPU time over wall time, percent
    uint32_t networkRequests{0};       ///< Fetch attempts, denied ones included
    uint64_t networkBytes{0};          ///< Request plus response body bytes
    std::vector<std::string> warnings; ///< Advisory limit notices

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ExecuteResult> fromJson(const json& j);
};

/**
 * @brief Console line forwarded from guest code
 */
struct LogRecord {
    std::string level;     ///< log, info, warn, error or debug
    std::string message;
    int64_t timestamp{0};  ///< Milliseconds since the Unix epoch

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<LogRecord> fromJson(const json& j);
};

/**
 * @brief Best-effort report of an error not tied to the current call
 */
struct DiagnosticReport {
    std::string error;
    std::optional<std::string> stack;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<DiagnosticReport> fromJson(const json& j);
};

/**
 * @brief Outbound request issued through the guest fetch primitive
 */
struct NetworkRequestPayload {
    std::string url;
    std::string method{"GET"};
    json headers = json::object();
    std::string body;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<NetworkRequestPayload> fromJson(const json& j);
};

/**
 * @brief Controller answer to a NetworkRequest
 */
struct NetworkResponsePayload {
    bool ok{false};
    int status{0};
    json headers = json::object();
    std::string body;
    std::string error;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<NetworkResponsePayload> fromJson(const json& j);
};

/**
 * @brief Handshake payload
 *
 * Exchanged once between the controller and a freshly spawned worker.
 * The controller assigns the context id; the worker echoes it back.
 */
struct HandshakePayload {
    std::string version;                    ///< Protocol version
    std::string pythonVersion;              ///< Guest interpreter version
    std::vector<std::string> capabilities;  ///< Supported capabilities
    uint32_t pid{0};                        ///< Process ID of the sender
    uint32_t contextId{0};                  ///< Context assigned by controller

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<HandshakePayload> fromJson(const json& j);
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_MESSAGE_HPP
