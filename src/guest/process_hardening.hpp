/*
 * process_hardening.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_GUEST_PROCESS_HARDENING_HPP
#define WARDEN_GUEST_PROCESS_HARDENING_HPP

#include "../sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>

namespace warden::guest {

/**
 * @brief Process-wide restrictions applied once, before any guest code
 */
struct HardeningOptions {
    bool parentDeathSignal{false};            ///< SIGKILL when the forking thread dies
    std::filesystem::path workingDirectory;   ///< chdir target, empty = keep
};

/**
 * @brief Kernel ceilings for one execution
 */
struct ExecutionLimits {
    uint64_t memory{0};                       ///< Bytes on top of the current address space, 0 = none
    uint64_t storage{0};                      ///< Largest file the run may write, 0 = none
    std::chrono::milliseconds cpuTime{0};     ///< CPU time backstop, 0 = none
};

/**
 * @brief Address space allowed beyond the memory limit
 *
 * The sampled resident memory check ends a run first; the address space
 * limit only catches allocations that outpace the sampling period.
 */
inline constexpr uint64_t ADDRESS_SPACE_HEADROOM = 256ULL * 1024 * 1024;

/**
 * @brief Apply no-new-privs, non-dumpable, no core files and the working
 *        directory
 */
[[nodiscard]] sandbox::SandboxResult<void> applyBaseline(
    const HardeningOptions& options);

/**
 * @brief Install rlimits for the coming execution
 *
 * Only soft limits are changed, clamped to the hard limits.
 */
[[nodiscard]] sandbox::SandboxResult<void> applyExecutionLimits(
    const ExecutionLimits& limits);

/**
 * @brief Close every descriptor above stderr except @p keep
 */
void closeInheritedDescriptors(std::initializer_list<int> keep);

}  // namespace warden::guest

#endif  // WARDEN_GUEST_PROCESS_HARDENING_HPP
