/*
 * process_spawning.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace warden::sandbox {

namespace {

void clearCloseOnExec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC);
    }
}

SandboxResult<int> decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return std::unexpected(SandboxErrorCode::UnknownError);
}

}  // namespace

SandboxResult<int> ProcessSpawner::spawnWorker(
    const std::filesystem::path& executable,
    std::pair<int, int> subprocessFds,
    const std::filesystem::path& workingDirectory) {
    auto [readFd, writeFd] = subprocessFds;

    // Arguments are prepared before fork so the child only calls
    // async-signal-safe functions
    std::string exePath = executable.string();
    std::string readFdStr = std::to_string(readFd);
    std::string writeFdStr = std::to_string(writeFd);
    std::string workDir = workingDirectory.string();

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Fork failed: {}", std::strerror(errno));
        return std::unexpected(SandboxErrorCode::SpawnFailed);
    }

    if (pid == 0) {
        clearCloseOnExec(readFd);
        clearCloseOnExec(writeFd);

        if (!workDir.empty() && chdir(workDir.c_str()) != 0) {
            _exit(126);
        }

        execl(exePath.c_str(), exePath.c_str(), readFdStr.c_str(),
              writeFdStr.c_str(), static_cast<char*>(nullptr));

        _exit(127);
    }

    spdlog::debug("Spawned sandbox worker {} with PID {}", exePath, pid);
    return static_cast<int>(pid);
}

SandboxResult<int> ProcessSpawner::forkChild(const std::function<int()>& body) {
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Fork failed: {}", std::strerror(errno));
        return std::unexpected(SandboxErrorCode::SpawnFailed);
    }

    if (pid == 0) {
        int code = 1;
        try {
            code = body();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "sandbox context failed: %s\n", e.what());
        }
        std::fflush(stderr);
        _exit(code);
    }

    spdlog::debug("Forked sandbox context with PID {}", pid);
    return static_cast<int>(pid);
}

SandboxResult<int> ProcessSpawner::waitForProcess(int processId, int timeoutMs) {
    if (processId <= 0) {
        return std::unexpected(SandboxErrorCode::UnknownError);
    }

    int status = 0;
    if (timeoutMs == 0) {
        pid_t result;
        do {
            result = waitpid(processId, &status, 0);
        } while (result < 0 && errno == EINTR);
        if (result != processId) {
            return std::unexpected(SandboxErrorCode::UnknownError);
        }
        return decodeStatus(status);
    }

    int elapsed = 0;
    while (elapsed < timeoutMs) {
        pid_t result = waitpid(processId, &status, WNOHANG);
        if (result == processId) {
            return decodeStatus(status);
        }
        if (result < 0 && errno != EINTR) {
            return std::unexpected(SandboxErrorCode::UnknownError);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        elapsed += 10;
    }

    return std::unexpected(SandboxErrorCode::Timeout);
}

SandboxResult<void> ProcessSpawner::killProcess(int processId) {
    if (processId <= 0) {
        return {};
    }
    if (kill(processId, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to kill process {}: {}", processId,
                     std::strerror(errno));
        return std::unexpected(SandboxErrorCode::UnknownError);
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(processId, &status, 0);
    } while (result < 0 && errno == EINTR);
    return {};
}

void ProcessSpawner::signalKill(int processId) noexcept {
    if (processId > 0) {
        kill(processId, SIGKILL);
    }
}

bool ProcessSpawner::isProcessRunning(int processId) {
    if (processId <= 0) {
        return false;
    }
    int status = 0;
    pid_t result = waitpid(processId, &status, WNOHANG);
    if (result == processId) {
        return false;
    }
    return kill(processId, 0) == 0;
}

}  // namespace warden::sandbox
