/*
 * serializer.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_IPC_SERIALIZER_HPP
#define WARDEN_IPC_SERIALIZER_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <vector>

#include "message_types.hpp"

namespace warden::ipc {

using json = nlohmann::json;

/**
 * @brief Payload codec for IPC messages
 *
 * Payloads travel as MessagePack so that binary-safe strings produced by
 * guest code survive the pipe unchanged.
 */
class IPCSerializer {
public:
    /**
     * @brief Serialize JSON to MessagePack
     */
    [[nodiscard]] static std::vector<uint8_t> serialize(const json& data);

    /**
     * @brief Deserialize MessagePack to JSON
     */
    [[nodiscard]] static IPCResult<json> deserialize(
        std::span<const uint8_t> data);
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_SERIALIZER_HPP
