/*
 * process_hardening.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "process_hardening.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

namespace warden::guest {

namespace {

bool setSoftLimit(int resource, rlim_t value) {
    struct rlimit limit {};
    if (getrlimit(resource, &limit) != 0) {
        return false;
    }
    limit.rlim_cur = (limit.rlim_max == RLIM_INFINITY)
                         ? value
                         : std::min<rlim_t>(value, limit.rlim_max);
    return setrlimit(resource, &limit) == 0;
}

uint64_t currentAddressSpace() {
    std::ifstream statm("/proc/self/statm");
    uint64_t pages = 0;
    if (!(statm >> pages)) {
        return 0;
    }
    return pages * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
}

}  // namespace

sandbox::SandboxResult<void> applyBaseline(const HardeningOptions& options) {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        spdlog::error("PR_SET_NO_NEW_PRIVS failed: {}", std::strerror(errno));
        return std::unexpected(sandbox::SandboxErrorCode::SpawnFailed);
    }
    if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0) {
        spdlog::warn("PR_SET_DUMPABLE failed: {}", std::strerror(errno));
    }

    struct rlimit noCore {0, 0};
    if (setrlimit(RLIMIT_CORE, &noCore) != 0) {
        spdlog::warn("Disabling core files failed: {}", std::strerror(errno));
    }

    if (options.parentDeathSignal) {
        pid_t parent = getppid();
        if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
            spdlog::error("PR_SET_PDEATHSIG failed: {}", std::strerror(errno));
            return std::unexpected(sandbox::SandboxErrorCode::SpawnFailed);
        }
        // The parent may have died before the signal was armed
        if (getppid() != parent) {
            std::_Exit(1);
        }
    }

    // Oversized writes fail with EFBIG instead of killing the process
    std::signal(SIGXFSZ, SIG_IGN);

    if (!options.workingDirectory.empty() &&
        chdir(options.workingDirectory.c_str()) != 0) {
        spdlog::error("chdir({}) failed: {}", options.workingDirectory.string(),
                      std::strerror(errno));
        return std::unexpected(sandbox::SandboxErrorCode::SpawnFailed);
    }

    return {};
}

sandbox::SandboxResult<void> applyExecutionLimits(const ExecutionLimits& limits) {
    if (limits.memory > 0) {
        auto ceiling = currentAddressSpace() + limits.memory + ADDRESS_SPACE_HEADROOM;
        if (!setSoftLimit(RLIMIT_AS, static_cast<rlim_t>(ceiling))) {
            spdlog::error("RLIMIT_AS failed: {}", std::strerror(errno));
            return std::unexpected(sandbox::SandboxErrorCode::SpawnFailed);
        }
    }

    if (limits.storage > 0 &&
        !setSoftLimit(RLIMIT_FSIZE, static_cast<rlim_t>(limits.storage))) {
        spdlog::error("RLIMIT_FSIZE failed: {}", std::strerror(errno));
        return std::unexpected(sandbox::SandboxErrorCode::SpawnFailed);
    }

    if (limits.cpuTime.count() > 0) {
        // Whole seconds, rounded up, plus one second of slack
        auto seconds = (limits.cpuTime.count() + 999) / 1000 + 1;
        if (!setSoftLimit(RLIMIT_CPU, static_cast<rlim_t>(seconds))) {
            spdlog::error("RLIMIT_CPU failed: {}", std::strerror(errno));
            return std::unexpected(sandbox::SandboxErrorCode::SpawnFailed);
        }
    }

    return {};
}

void closeInheritedDescriptors(std::initializer_list<int> keep) {
    std::vector<int> toClose;

    DIR* dir = opendir("/proc/self/fd");
    if (dir == nullptr) {
        return;
    }
    int dirFd = dirfd(dir);
    while (auto* entry = readdir(dir)) {
        if (entry->d_name[0] == '.') {
            continue;
        }
        int fd = std::atoi(entry->d_name);
        if (fd <= STDERR_FILENO || fd == dirFd ||
            std::find(keep.begin(), keep.end(), fd) != keep.end()) {
            continue;
        }
        toClose.push_back(fd);
    }
    closedir(dir);

    for (int fd : toClose) {
        close(fd);
    }
}

}  // namespace warden::guest
