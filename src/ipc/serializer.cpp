/*
 * serializer.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "serializer.hpp"

#include <spdlog/spdlog.h>

namespace warden::ipc {

std::vector<uint8_t> IPCSerializer::serialize(const json& data) {
    return json::to_msgpack(data);
}

IPCResult<json> IPCSerializer::deserialize(std::span<const uint8_t> data) {
    if (data.empty()) {
        return json::object();
    }
    try {
        return json::from_msgpack(data.begin(), data.end());
    } catch (const json::exception& e) {
        spdlog::error("Failed to decode IPC payload ({} bytes): {}",
                      data.size(), e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

}  // namespace warden::ipc
