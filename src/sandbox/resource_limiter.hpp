/*
 * resource_limiter.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file resource_limiter.hpp
 * @brief Live resource limits of a sandbox instance
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_RESOURCE_LIMITER_HPP
#define WARDEN_SANDBOX_RESOURCE_LIMITER_HPP

#include <chrono>
#include <memory>

#include "types.hpp"

namespace warden::sandbox {

/**
 * @brief Holds the one live ResourceLimits copy of a sandbox
 *
 * Thread-safe: limits may be changed from any thread while a call is in
 * flight; the change applies from the next dispatch on.
 */
class ResourceLimiter {
public:
    ResourceLimiter();
    explicit ResourceLimiter(const ResourceLimits& limits);
    ~ResourceLimiter();

    ResourceLimiter(const ResourceLimiter&) = delete;
    ResourceLimiter& operator=(const ResourceLimiter&) = delete;
    ResourceLimiter(ResourceLimiter&&) noexcept;
    ResourceLimiter& operator=(ResourceLimiter&&) noexcept;

    /**
     * @brief Apply the fields present in @p patch
     *
     * CPU is clamped to 0..100.
     */
    void apply(const ResourceLimitsPatch& patch);

    /**
     * @brief Replace all limits
     */
    void reset(const ResourceLimits& limits);

    [[nodiscard]] auto current() const -> ResourceLimits;

    void setMemory(uint64_t bytes);
    [[nodiscard]] auto getMemory() const -> uint64_t;

    void setCpuPercent(int percent);
    [[nodiscard]] auto getCpuPercent() const -> int;

    void setNetworkBudget(uint64_t bytes);
    [[nodiscard]] auto getNetworkBudget() const -> uint64_t;

    void setStorage(uint64_t bytes);
    [[nodiscard]] auto getStorage() const -> uint64_t;

    void setExecutionTime(std::chrono::milliseconds duration);
    [[nodiscard]] auto getExecutionTime() const -> std::chrono::milliseconds;

    /**
     * @brief Merge caller context with the limits the guest may see
     *
     * Caller fields come first; memoryLimit and executionTime override
     * fields of the same name.
     */
    [[nodiscard]] auto mergeContext(const ExecutionContext& context) const -> json;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_RESOURCE_LIMITER_HPP
