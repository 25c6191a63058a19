/*
 * process_spawning.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_PROCESS_SPAWNING_HPP
#define WARDEN_SANDBOX_PROCESS_SPAWNING_HPP

#include "types.hpp"

#include <filesystem>
#include <functional>
#include <utility>

namespace warden::sandbox {

/**
 * @brief Creation and reaping of sandbox processes
 */
class ProcessSpawner {
public:
    /**
     * @brief Start the worker executable
     * @param executable Path to warden-worker
     * @param subprocessFds Descriptors handed to the worker (read, write)
     * @param workingDirectory Directory the worker starts in, empty = inherit
     * @return Process ID on success, or error
     */
    [[nodiscard]] static SandboxResult<int> spawnWorker(
        const std::filesystem::path& executable,
        std::pair<int, int> subprocessFds,
        const std::filesystem::path& workingDirectory = {});

    /**
     * @brief Fork a child that runs @p body and exits with its return value
     *
     * The child never returns into the caller. An exception escaping
     * @p body is written to stderr and the child exits with status 1.
     *
     * @return Process ID on success, or error
     */
    [[nodiscard]] static SandboxResult<int> forkChild(
        const std::function<int()>& body);

    /**
     * @brief Wait for process to exit
     * @param processId Process ID to wait for
     * @param timeoutMs Timeout in milliseconds (0 = infinite)
     * @return Exit code or error
     */
    [[nodiscard]] static SandboxResult<int> waitForProcess(int processId,
                                                          int timeoutMs = 0);

    /**
     * @brief Kill a running process and reap it
     */
    [[nodiscard]] static SandboxResult<void> killProcess(int processId);

    /**
     * @brief Deliver SIGKILL without waiting
     */
    static void signalKill(int processId) noexcept;

    /**
     * @brief Check if process is still running
     */
    [[nodiscard]] static bool isProcessRunning(int processId);
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_PROCESS_SPAWNING_HPP
