/*
 * channel.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "channel.hpp"
#include "message.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace warden::ipc {

namespace {

void ignoreBrokenPipeSignal() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction current {};
        if (sigaction(SIGPIPE, nullptr, &current) == 0 &&
            current.sa_handler == SIG_DFL) {
            ::signal(SIGPIPE, SIG_IGN);
        }
    });
}

}  // namespace

// ============================================================================
// PipeChannel::Impl Implementation
// ============================================================================

class PipeChannel::Impl {
public:
    Impl() = default;

    ~Impl() { close(); }

    IPCResult<void> create() {
        close();
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            spdlog::error("Failed to create pipe: {}", std::strerror(errno));
            return std::unexpected(IPCError::PipeError);
        }
        readFd_ = fds[0];
        writeFd_ = fds[1];
        return {};
    }

    void adopt(int readFd, int writeFd) {
        close();
        readFd_ = readFd;
        writeFd_ = writeFd;
    }

    void close() {
        closeRead();
        closeWrite();
    }

    bool isOpen() const noexcept { return readFd_ >= 0 || writeFd_ >= 0; }

    IPCResult<void> send(const Message& message) {
        if (writeFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }
        if (message.payload.size() > ProtocolConstants::MAX_PAYLOAD_SIZE) {
            return std::unexpected(IPCError::MessageTooLarge);
        }

        auto data = message.serialize();

        std::lock_guard<std::mutex> lock(writeMutex_);

        size_t totalWritten = 0;
        while (totalWritten < data.size()) {
            auto written = ::write(writeFd_, data.data() + totalWritten,
                                   data.size() - totalWritten);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EPIPE) {
                    return std::unexpected(IPCError::ChannelClosed);
                }
                spdlog::error("Pipe write failed: {}", std::strerror(errno));
                return std::unexpected(IPCError::PipeError);
            }
            totalWritten += static_cast<size_t>(written);
        }

        return {};
    }

    IPCResult<Message> receive(std::chrono::milliseconds timeout) {
        if (readFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds{0};
            }

            struct pollfd pfd {};
            pfd.fd = readFd_;
            pfd.events = POLLIN;

            int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ret > 0) {
                break;
            }
            if (ret == 0) {
                return std::unexpected(IPCError::Timeout);
            }
            if (errno != EINTR) {
                return std::unexpected(IPCError::PipeError);
            }
        }

        std::vector<uint8_t> headerData(MessageHeader::SIZE);
        if (auto status = readExact(headerData.data(), headerData.size());
            !status) {
            return std::unexpected(status.error());
        }

        auto headerResult = MessageHeader::deserialize(headerData);
        if (!headerResult) {
            spdlog::error("Dropping malformed frame: {}",
                          ipcErrorToString(headerResult.error()));
            return std::unexpected(headerResult.error());
        }

        Message msg;
        msg.header = *headerResult;
        msg.payload.resize(headerResult->payloadSize);
        if (auto status = readExact(msg.payload.data(), msg.payload.size());
            !status) {
            return std::unexpected(status.error());
        }

        return msg;
    }

    bool hasData() const {
        if (readFd_ < 0) {
            return false;
        }
        struct pollfd pfd {};
        pfd.fd = readFd_;
        pfd.events = POLLIN;
        return ::poll(&pfd, 1, 0) > 0;
    }

    int getReadFd() const noexcept { return readFd_; }
    int getWriteFd() const noexcept { return writeFd_; }

    void closeRead() {
        if (readFd_ >= 0) {
            ::close(readFd_);
            readFd_ = -1;
        }
    }

    void closeWrite() {
        if (writeFd_ >= 0) {
            ::close(writeFd_);
            writeFd_ = -1;
        }
    }

private:
    IPCResult<void> readExact(uint8_t* buffer, size_t size) {
        size_t total = 0;
        while (total < size) {
            auto bytesRead = ::read(readFd_, buffer + total, size - total);
            if (bytesRead == 0) {
                return std::unexpected(IPCError::ChannelClosed);
            }
            if (bytesRead < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(IPCError::PipeError);
            }
            total += static_cast<size_t>(bytesRead);
        }
        return {};
    }

    int readFd_{-1};
    int writeFd_{-1};
    std::mutex writeMutex_;
};

// ============================================================================
// PipeChannel Implementation
// ============================================================================

PipeChannel::PipeChannel() : pImpl_(std::make_unique<Impl>()) {}
PipeChannel::~PipeChannel() = default;

PipeChannel::PipeChannel(PipeChannel&& other) noexcept = default;
PipeChannel& PipeChannel::operator=(PipeChannel&& other) noexcept = default;

IPCResult<void> PipeChannel::create() { return pImpl_->create(); }
void PipeChannel::adopt(int readFd, int writeFd) { pImpl_->adopt(readFd, writeFd); }
void PipeChannel::close() { pImpl_->close(); }
bool PipeChannel::isOpen() const noexcept { return pImpl_->isOpen(); }
IPCResult<void> PipeChannel::send(const Message& message) {
    return pImpl_->send(message);
}
IPCResult<Message> PipeChannel::receive(std::chrono::milliseconds timeout) {
    return pImpl_->receive(timeout);
}
bool PipeChannel::hasData() const { return pImpl_->hasData(); }
int PipeChannel::getReadFd() const noexcept { return pImpl_->getReadFd(); }
int PipeChannel::getWriteFd() const noexcept { return pImpl_->getWriteFd(); }
void PipeChannel::closeRead() { pImpl_->closeRead(); }
void PipeChannel::closeWrite() { pImpl_->closeWrite(); }

// ============================================================================
// BidirectionalChannel Implementation
// ============================================================================

BidirectionalChannel::BidirectionalChannel() = default;
BidirectionalChannel::~BidirectionalChannel() = default;

IPCResult<void> BidirectionalChannel::create() {
    ignoreBrokenPipeSignal();

    auto result1 = parentToChild_.create();
    if (!result1) return result1;

    auto result2 = childToParent_.create();
    if (!result2) {
        parentToChild_.close();
        return result2;
    }

    return {};
}

void BidirectionalChannel::close() {
    parentToChild_.close();
    childToParent_.close();
}

bool BidirectionalChannel::isOpen() const noexcept {
    return parentToChild_.isOpen() && childToParent_.isOpen();
}

PipeChannel& BidirectionalChannel::outbound() noexcept {
    return role_.load() == ChannelRole::Child ? childToParent_ : parentToChild_;
}

PipeChannel& BidirectionalChannel::inbound() noexcept {
    return role_.load() == ChannelRole::Child ? parentToChild_ : childToParent_;
}

IPCResult<void> BidirectionalChannel::send(const Message& message) {
    return outbound().send(message);
}

IPCResult<void> BidirectionalChannel::send(MessageType type, const json& payload) {
    return send(Message::create(type, payload, sequenceId_++, contextId_.load()));
}

IPCResult<Message> BidirectionalChannel::receive(std::chrono::milliseconds timeout) {
    return inbound().receive(timeout);
}

std::pair<int, int> BidirectionalChannel::getSubprocessFds() const noexcept {
    return {parentToChild_.getReadFd(), childToParent_.getWriteFd()};
}

void BidirectionalChannel::setupParent() {
    parentToChild_.closeRead();
    childToParent_.closeWrite();
    role_ = ChannelRole::Parent;
}

void BidirectionalChannel::setupChild() {
    parentToChild_.closeWrite();
    childToParent_.closeRead();
    role_ = ChannelRole::Child;
}

void BidirectionalChannel::adoptChild(int readFd, int writeFd) {
    parentToChild_.adopt(readFd, -1);
    childToParent_.adopt(-1, writeFd);
    role_ = ChannelRole::Child;
}

ChannelRole BidirectionalChannel::role() const noexcept { return role_.load(); }

void BidirectionalChannel::setContextId(uint32_t contextId) noexcept {
    contextId_ = contextId;
}

uint32_t BidirectionalChannel::contextId() const noexcept {
    return contextId_.load();
}

IPCResult<HandshakePayload> BidirectionalChannel::performHandshake(
    std::chrono::milliseconds timeout) {
    HandshakePayload request;
    request.version = std::string(ProtocolConstants::VERSION_STRING);
    request.pid = static_cast<uint32_t>(::getpid());
    request.contextId = contextId_.load();
    request.capabilities = {"execute", "console", "fetch"};

    auto sendResult = send(MessageType::Handshake, request.toJson());
    if (!sendResult) {
        return std::unexpected(sendResult.error());
    }

    auto response = receive(timeout);
    if (!response) {
        return std::unexpected(response.error());
    }

    if (response->header.type != MessageType::HandshakeAck) {
        spdlog::error("Expected HandshakeAck, got {}",
                      messageTypeName(response->header.type));
        return std::unexpected(IPCError::InvalidMessage);
    }

    auto payloadResult = response->getPayloadAsJson();
    if (!payloadResult) {
        return std::unexpected(payloadResult.error());
    }

    auto ack = HandshakePayload::fromJson(*payloadResult);
    if (!ack) {
        return ack;
    }
    if (ack->contextId != request.contextId ||
        response->header.contextId != request.contextId) {
        spdlog::error("Handshake context mismatch: expected {}, got {}",
                      request.contextId, ack->contextId);
        return std::unexpected(IPCError::HandshakeRejected);
    }
    if (ack->version != request.version) {
        spdlog::error("Protocol version mismatch: {} vs {}", request.version,
                      ack->version);
        return std::unexpected(IPCError::HandshakeRejected);
    }

    return ack;
}

IPCResult<void> BidirectionalChannel::respondToHandshake(
    const HandshakePayload& payload) {
    return send(MessageType::HandshakeAck, payload.toJson());
}

}  // namespace warden::ipc
