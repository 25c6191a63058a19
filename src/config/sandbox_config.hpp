/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/*************************************************

Date: 2024-11-30

Description: Sandbox engine configuration

**************************************************/

#ifndef WARDEN_CONFIG_SANDBOX_CONFIG_HPP
#define WARDEN_CONFIG_SANDBOX_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "../logging/logger.hpp"
#include "../sandbox/types.hpp"

namespace warden::config {

using json = nlohmann::json;

/**
 * @brief Configuration of a sandbox instance
 */
struct SandboxConfig {
    std::string backend{"worker"};           ///< worker or context
    std::string workerExecutable;            ///< warden-worker path (empty = discover)
    sandbox::ResourceLimits limits;          ///< Initial resource limits
    size_t defaultTimeoutMs{30000};          ///< Controller deadline when the call sets none
    size_t monitorIntervalMs{100};           ///< Sampling period inside the context
    uint32_t networkRequestCap{10};          ///< fetch calls allowed per execution
    size_t handshakeTimeoutMs{10000};        ///< Wait for a new worker to answer
    std::string workingDirectory;            ///< Sandbox cwd (empty = /tmp)
    logging::LoggingConfig logging;          ///< Logging of the embedding process

    [[nodiscard]] json toJson() const;

    [[nodiscard]] static SandboxConfig fromJson(const json& j);

    /**
     * @brief Load a JSON configuration file
     * @throws std::runtime_error if the file is missing or malformed
     */
    [[nodiscard]] static SandboxConfig fromFile(const std::filesystem::path& path);

    /**
     * @brief Check the values for consistency
     */
    [[nodiscard]] sandbox::SandboxResult<void> validate() const;

    /**
     * @brief Directory the sandbox process runs in
     */
    [[nodiscard]] std::filesystem::path effectiveWorkingDirectory() const;
};

}  // namespace warden::config

#endif  // WARDEN_CONFIG_SANDBOX_CONFIG_HPP
