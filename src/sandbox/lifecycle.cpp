/*
 * lifecycle.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "lifecycle.hpp"
#include "../ipc/message.hpp"
#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

namespace warden::sandbox {

namespace {
constexpr int kGracePeriodMs = 200;
}  // namespace

ProcessLifecycle::ProcessLifecycle() = default;

ProcessLifecycle::~ProcessLifecycle() { shutdown(); }

void ProcessLifecycle::attach(int processId,
                              std::shared_ptr<ipc::BidirectionalChannel> channel) {
    std::lock_guard lock(mutex_);
    processId_ = processId;
    channel_ = std::move(channel);
}

int ProcessLifecycle::processId() const {
    std::lock_guard lock(mutex_);
    return processId_;
}

std::shared_ptr<ipc::BidirectionalChannel> ProcessLifecycle::channel() const {
    std::lock_guard lock(mutex_);
    return channel_;
}

bool ProcessLifecycle::isAttached() const {
    std::lock_guard lock(mutex_);
    return processId_ > 0;
}

bool ProcessLifecycle::requestTermination() {
    std::lock_guard lock(mutex_);
    terminationRequested_ = true;
    if (processId_ <= 0) {
        return false;
    }
    ProcessSpawner::signalKill(processId_);
    spdlog::debug("Termination requested for sandbox process {}", processId_);
    return true;
}

bool ProcessLifecycle::isTerminationRequested() const noexcept {
    return terminationRequested_.load();
}

void ProcessLifecycle::resetTermination() noexcept { terminationRequested_ = false; }

void ProcessLifecycle::shutdown() {
    std::lock_guard lock(mutex_);

    if (channel_ && channel_->isOpen() && processId_ > 0 &&
        !terminationRequested_) {
        auto sent = channel_->send(ipc::MessageType::Shutdown, json::object());
        if (sent) {
            auto exited = ProcessSpawner::waitForProcess(processId_, kGracePeriodMs);
            if (exited) {
                spdlog::debug("Sandbox process {} exited with {}", processId_, *exited);
                processId_ = -1;
            }
        } else {
            spdlog::debug("Shutdown notice not delivered: {}",
                          ipc::ipcErrorToString(sent.error()));
        }
    }

    if (processId_ > 0) {
        auto killed = ProcessSpawner::killProcess(processId_);
        if (!killed) {
            spdlog::warn("Failed to reap sandbox process {}", processId_);
        }
        spdlog::debug("Sandbox process {} stopped", processId_);
        processId_ = -1;
    }

    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

}  // namespace warden::sandbox
