/*
 * resource_limiter.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "resource_limiter.hpp"

#include <algorithm>
#include <atomic>

#include <spdlog/spdlog.h>

namespace warden::sandbox {

class ResourceLimiter::Impl {
public:
    std::atomic<uint64_t> memory_{ResourceLimits::DEFAULT_MEMORY};
    std::atomic<int> cpu_{ResourceLimits::DEFAULT_CPU};
    std::atomic<uint64_t> network_{ResourceLimits::DEFAULT_NETWORK};
    std::atomic<uint64_t> storage_{ResourceLimits::DEFAULT_STORAGE};
    std::atomic<int64_t> executionTimeMs_{
        ResourceLimits::DEFAULT_EXECUTION_TIME.count()};
};

ResourceLimiter::ResourceLimiter() : pImpl_(std::make_unique<Impl>()) {}

ResourceLimiter::ResourceLimiter(const ResourceLimits& limits)
    : pImpl_(std::make_unique<Impl>()) {
    reset(limits);
}

ResourceLimiter::~ResourceLimiter() = default;

ResourceLimiter::ResourceLimiter(ResourceLimiter&&) noexcept = default;
ResourceLimiter& ResourceLimiter::operator=(ResourceLimiter&&) noexcept = default;

void ResourceLimiter::apply(const ResourceLimitsPatch& patch) {
    if (patch.memory) setMemory(*patch.memory);
    if (patch.cpu) setCpuPercent(*patch.cpu);
    if (patch.network) setNetworkBudget(*patch.network);
    if (patch.storage) setStorage(*patch.storage);
    if (patch.executionTime) setExecutionTime(*patch.executionTime);
}

void ResourceLimiter::reset(const ResourceLimits& limits) {
    setMemory(limits.memory);
    setCpuPercent(limits.cpu);
    setNetworkBudget(limits.network);
    setStorage(limits.storage);
    setExecutionTime(limits.executionTime);
}

auto ResourceLimiter::current() const -> ResourceLimits {
    ResourceLimits limits;
    limits.memory = pImpl_->memory_.load();
    limits.cpu = pImpl_->cpu_.load();
    limits.network = pImpl_->network_.load();
    limits.storage = pImpl_->storage_.load();
    limits.executionTime =
        std::chrono::milliseconds(pImpl_->executionTimeMs_.load());
    return limits;
}

void ResourceLimiter::setMemory(uint64_t bytes) {
    pImpl_->memory_ = bytes;
    spdlog::debug("ResourceLimiter: set memory limit to {} bytes", bytes);
}

auto ResourceLimiter::getMemory() const -> uint64_t {
    return pImpl_->memory_.load();
}

void ResourceLimiter::setCpuPercent(int percent) {
    pImpl_->cpu_ = std::clamp(percent, 0, 100);
    spdlog::debug("ResourceLimiter: set CPU ceiling to {}%", pImpl_->cpu_.load());
}

auto ResourceLimiter::getCpuPercent() const -> int {
    return pImpl_->cpu_.load();
}

void ResourceLimiter::setNetworkBudget(uint64_t bytes) {
    pImpl_->network_ = bytes;
    spdlog::debug("ResourceLimiter: set network budget to {} bytes", bytes);
}

auto ResourceLimiter::getNetworkBudget() const -> uint64_t {
    return pImpl_->network_.load();
}

void ResourceLimiter::setStorage(uint64_t bytes) {
    pImpl_->storage_ = bytes;
    spdlog::debug("ResourceLimiter: set storage limit to {} bytes", bytes);
}

auto ResourceLimiter::getStorage() const -> uint64_t {
    return pImpl_->storage_.load();
}

void ResourceLimiter::setExecutionTime(std::chrono::milliseconds duration) {
    pImpl_->executionTimeMs_ = std::max<int64_t>(0, duration.count());
    spdlog::debug("ResourceLimiter: set execution time limit to {}ms",
                  pImpl_->executionTimeMs_.load());
}

auto ResourceLimiter::getExecutionTime() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds(pImpl_->executionTimeMs_.load());
}

auto ResourceLimiter::mergeContext(const ExecutionContext& context) const -> json {
    json merged = context.values.is_object() ? context.values : json::object();
    merged["memoryLimit"] = getMemory();
    merged["executionTime"] = getExecutionTime().count();
    return merged;
}

}  // namespace warden::sandbox
