/*
 * guest_runtime.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file guest_runtime.hpp
 * @brief Message loop of an isolated sandbox process
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_GUEST_GUEST_RUNTIME_HPP
#define WARDEN_GUEST_GUEST_RUNTIME_HPP

#include <atomic>
#include <memory>

#include "../ipc/channel.hpp"
#include "../ipc/message.hpp"

namespace warden::guest {

/**
 * @brief Runtime behaviour switches
 */
struct GuestRuntimeOptions {
    bool singleShot{false};   ///< Return after the first execution
    bool cpuBackstop{false};  ///< Arm RLIMIT_CPU from the execution time limit
};

/**
 * @brief Serves the controller from inside the isolated process
 *
 * Answers the handshake, runs each Execute request under a metrics
 * monitor and reports exactly one terminal message per request. A limit
 * violation detected by the monitor ends the process right after its
 * Error message is written.
 */
class GuestRuntime {
public:
    GuestRuntime(ipc::BidirectionalChannel& channel,
                 GuestRuntimeOptions options = {});
    ~GuestRuntime();

    GuestRuntime(const GuestRuntime&) = delete;
    GuestRuntime& operator=(const GuestRuntime&) = delete;

    /**
     * @brief Process messages until Shutdown, end of stream or, in
     *        single-shot mode, the first completed execution
     * @return Process exit code
     */
    int serve();

    /**
     * @brief Run one request and send its terminal message
     */
    void execute(const ipc::ExecuteRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::guest

#endif  // WARDEN_GUEST_GUEST_RUNTIME_HPP
