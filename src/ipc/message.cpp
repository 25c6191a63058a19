/*
 * message.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "message.hpp"
#include "serializer.hpp"

#include <spdlog/spdlog.h>

namespace warden::ipc {

namespace {

void putU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t getU32(std::span<const uint8_t> data, size_t offset) {
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

}  // namespace

// ============================================================================
// MessageHeader Implementation
// ============================================================================

std::vector<uint8_t> MessageHeader::serialize() const {
    std::vector<uint8_t> data;
    data.reserve(SIZE);

    putU32(data, magic);
    data.push_back(version);
    data.push_back(static_cast<uint8_t>(type));
    data.push_back(flags);
    data.push_back(reserved);
    putU32(data, payloadSize);
    putU32(data, sequenceId);
    putU32(data, contextId);

    return data;
}

IPCResult<MessageHeader> MessageHeader::deserialize(std::span<const uint8_t> data) {
    if (data.size() < SIZE) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    MessageHeader header;
    header.magic = getU32(data, 0);
    if (header.magic != MAGIC) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    header.version = data[4];
    header.type = static_cast<MessageType>(data[5]);
    header.flags = data[6];
    header.reserved = data[7];
    header.payloadSize = getU32(data, 8);
    header.sequenceId = getU32(data, 12);
    header.contextId = getU32(data, 16);

    if (header.version != VERSION) {
        return std::unexpected(IPCError::InvalidMessage);
    }
    if (header.payloadSize > ProtocolConstants::MAX_PAYLOAD_SIZE) {
        return std::unexpected(IPCError::MessageTooLarge);
    }

    return header;
}

bool MessageHeader::isValid() const noexcept {
    return magic == MAGIC && version == VERSION &&
           payloadSize <= ProtocolConstants::MAX_PAYLOAD_SIZE;
}

// ============================================================================
// Message Implementation
// ============================================================================

Message Message::create(MessageType type, const json& payload,
                        uint32_t sequenceId, uint32_t contextId) {
    Message msg;
    msg.header.type = type;
    msg.header.sequenceId = sequenceId;
    msg.header.contextId = contextId;
    msg.payload = IPCSerializer::serialize(payload);
    msg.header.payloadSize = static_cast<uint32_t>(msg.payload.size());
    return msg;
}

IPCResult<json> Message::getPayloadAsJson() const {
    if (payload.empty()) {
        return json::object();
    }
    return IPCSerializer::deserialize(payload);
}

std::vector<uint8_t> Message::serialize() const {
    auto result = header.serialize();
    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

IPCResult<Message> Message::deserialize(std::span<const uint8_t> data) {
    auto headerResult = MessageHeader::deserialize(data);
    if (!headerResult) {
        return std::unexpected(headerResult.error());
    }

    Message msg;
    msg.header = *headerResult;

    size_t expectedSize = MessageHeader::SIZE + msg.header.payloadSize;
    if (data.size() < expectedSize) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    msg.payload.assign(data.begin() + MessageHeader::SIZE,
                       data.begin() + expectedSize);
    return msg;
}

// ============================================================================
// Payload Structures Implementation
// ============================================================================

json ExecuteRequest::toJson() const {
    return {
        {"code", code},
        {"context", context},
        {"network_access", networkAccess},
        {"memory_limit", memoryLimit},
        {"cpu_limit", cpuLimit},
        {"network_limit", networkLimit},
        {"storage_limit", storageLimit},
        {"execution_time_ms", executionTimeMs},
        {"monitor_interval_ms", monitorIntervalMs},
        {"network_request_cap", networkRequestCap}
    };
}

IPCResult<ExecuteRequest> ExecuteRequest::fromJson(const json& j) {
    try {
        ExecuteRequest req;
        req.code = j.at("code").get<std::string>();
        if (j.contains("context") && j["context"].is_object()) {
            req.context = j["context"];
        }
        req.networkAccess = j.value("network_access", req.networkAccess);
        req.memoryLimit = j.value("memory_limit", req.memoryLimit);
        req.cpuLimit = j.value("cpu_limit", req.cpuLimit);
        req.networkLimit = j.value("network_limit", req.networkLimit);
        req.storageLimit = j.value("storage_limit", req.storageLimit);
        req.executionTimeMs = j.value("execution_time_ms", req.executionTimeMs);
        req.monitorIntervalMs =
            j.value("monitor_interval_ms", req.monitorIntervalMs);
        req.networkRequestCap =
            j.value("network_request_cap", req.networkRequestCap);
        return req;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse ExecuteRequest: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json ExecuteResult::toJson() const {
    json j = {
        {"success", success},
        {"result", result},
        {"error", error},
        {"metrics", {
            {"execution_time_ms", executionTimeMs},
            {"memory_usage", memoryUsage},
            {"cpu_usage", cpuUsage},
            {"network_requests", networkRequests},
            {"network_bytes", networkBytes}
        }},
        {"warnings", warnings}
    };
    if (stack) {
        j["stack"] = *stack;
    }
    return j;
}

IPCResult<ExecuteResult> ExecuteResult::fromJson(const json& j) {
    try {
        ExecuteResult res;
        res.success = j.value("success", false);
        if (j.contains("result")) res.result = j["result"];
        res.error = j.value("error", "");
        res.stack = optionalString(j, "stack");
        if (j.contains("metrics")) {
            const auto& m = j["metrics"];
            res.executionTimeMs = m.value("execution_time_ms", int64_t{0});
            res.memoryUsage = m.value("memory_usage", uint64_t{0});
            res.cpuUsage = m.value("cpu_usage", 0.0);
            res.networkRequests = m.value("network_requests", uint32_t{0});
            res.networkBytes = m.value("network_bytes", uint64_t{0});
        }
        if (j.contains("warnings")) {
            res.warnings = j["warnings"].get<std::vector<std::string>>();
        }
        return res;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse ExecuteResult: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json LogRecord::toJson() const {
    return {{"level", level}, {"message", message}, {"timestamp", timestamp}};
}

IPCResult<LogRecord> LogRecord::fromJson(const json& j) {
    try {
        LogRecord record;
        record.level = j.value("level", "log");
        record.message = j.value("message", "");
        record.timestamp = j.value("timestamp", int64_t{0});
        return record;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse LogRecord: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json DiagnosticReport::toJson() const {
    json j = {{"error", error}};
    if (stack) {
        j["stack"] = *stack;
    }
    return j;
}

IPCResult<DiagnosticReport> DiagnosticReport::fromJson(const json& j) {
    try {
        DiagnosticReport report;
        report.error = j.value("error", "");
        report.stack = optionalString(j, "stack");
        return report;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse DiagnosticReport: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json NetworkRequestPayload::toJson() const {
    return {
        {"url", url},
        {"method", method},
        {"headers", headers},
        {"body", body}
    };
}

IPCResult<NetworkRequestPayload> NetworkRequestPayload::fromJson(const json& j) {
    try {
        NetworkRequestPayload req;
        req.url = j.at("url").get<std::string>();
        req.method = j.value("method", "GET");
        if (j.contains("headers") && j["headers"].is_object()) {
            req.headers = j["headers"];
        }
        req.body = j.value("body", "");
        return req;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse NetworkRequest: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json NetworkResponsePayload::toJson() const {
    json j = {
        {"ok", ok},
        {"status", status},
        {"headers", headers},
        {"body", body}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

IPCResult<NetworkResponsePayload> NetworkResponsePayload::fromJson(const json& j) {
    try {
        NetworkResponsePayload res;
        res.ok = j.value("ok", false);
        res.status = j.value("status", 0);
        if (j.contains("headers") && j["headers"].is_object()) {
            res.headers = j["headers"];
        }
        res.body = j.value("body", "");
        res.error = j.value("error", "");
        return res;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse NetworkResponse: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json HandshakePayload::toJson() const {
    return {
        {"version", version},
        {"python_version", pythonVersion},
        {"capabilities", capabilities},
        {"pid", pid},
        {"context_id", contextId}
    };
}

IPCResult<HandshakePayload> HandshakePayload::fromJson(const json& j) {
    try {
        HandshakePayload payload;
        payload.version = j.value("version", "");
        payload.pythonVersion = j.value("python_version", "");
        if (j.contains("capabilities")) {
            payload.capabilities =
                j["capabilities"].get<std::vector<std::string>>();
        }
        payload.pid = j.value("pid", uint32_t{0});
        payload.contextId = j.value("context_id", uint32_t{0});
        return payload;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse HandshakePayload: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

}  // namespace warden::ipc
