/*
 * lifecycle.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

#ifndef WARDEN_SANDBOX_LIFECYCLE_HPP
#define WARDEN_SANDBOX_LIFECYCLE_HPP

#include "../ipc/channel.hpp"
#include "types.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace warden::sandbox {

/**
 * @brief Ownership of one sandbox process and its channel
 *
 * Termination can be requested from any thread; the process is only
 * reaped by shutdown() on the thread that owns the execution.
 */
class ProcessLifecycle {
public:
    ProcessLifecycle();
    ~ProcessLifecycle();

    ProcessLifecycle(const ProcessLifecycle&) = delete;
    ProcessLifecycle& operator=(const ProcessLifecycle&) = delete;

    /**
     * @brief Take ownership of a started process
     */
    void attach(int processId, std::shared_ptr<ipc::BidirectionalChannel> channel);

    [[nodiscard]] int processId() const;

    [[nodiscard]] std::shared_ptr<ipc::BidirectionalChannel> channel() const;

    /**
     * @brief Whether a live process is attached
     */
    [[nodiscard]] bool isAttached() const;

    /**
     * @brief Kill the process without reaping it
     * @return True if there was a process to kill
     */
    bool requestTermination();

    [[nodiscard]] bool isTerminationRequested() const noexcept;

    void resetTermination() noexcept;

    /**
     * @brief Ask the process to exit, then kill and reap it and close the channel
     */
    void shutdown();

private:
    mutable std::mutex mutex_;
    std::shared_ptr<ipc::BidirectionalChannel> channel_;
    int processId_{-1};
    std::atomic<bool> terminationRequested_{false};
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_LIFECYCLE_HPP
