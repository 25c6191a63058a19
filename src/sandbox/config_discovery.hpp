/*
 * config_discovery.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_CONFIG_DISCOVERY_HPP
#define WARDEN_SANDBOX_CONFIG_DISCOVERY_HPP

#include "../config/sandbox_config.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>

namespace warden::sandbox {

/**
 * @brief Worker discovery and configuration checks
 */
class ConfigDiscovery {
public:
    /**
     * @brief Name of the worker program
     */
    static constexpr const char* WORKER_NAME = "warden-worker";

    /**
     * @brief Locate the worker executable
     *
     * Search order: the configured path, $WARDEN_WORKER_PATH, the directory
     * of the running executable, the install libexec directory, then PATH.
     *
     * @return Path to the worker or nullopt
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findWorkerExecutable(
        const config::SandboxConfig& config = {});

    /**
     * @brief Check that a path names a regular executable file
     */
    [[nodiscard]] static bool isExecutable(const std::filesystem::path& path);

    /**
     * @brief Validate the sandbox configuration
     * @param config Configuration to validate
     * @param requireWorker Also require a discoverable worker
     * @return Success or error
     */
    [[nodiscard]] static SandboxResult<void> validateConfig(
        const config::SandboxConfig& config, bool requireWorker = false);
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_CONFIG_DISCOVERY_HPP
