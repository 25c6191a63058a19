/*
 * channel.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file channel.hpp
 * @brief Pipe-based message channel between controller and sandbox
 * @date 2024
 * @version 1.0.0
 *
 * - PipeChannel: unidirectional framed pipe
 * - BidirectionalChannel: two pipes plus the role of the process using it,
 *   so the same object sends and receives on the correct ends after fork
 */

#ifndef WARDEN_IPC_CHANNEL_HPP
#define WARDEN_IPC_CHANNEL_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "message_types.hpp"

namespace warden::ipc {

using json = nlohmann::json;

struct HandshakePayload;
struct Message;

/**
 * @brief Unidirectional pipe carrying framed messages
 */
class PipeChannel {
public:
    PipeChannel();
    ~PipeChannel();

    PipeChannel(const PipeChannel&) = delete;
    PipeChannel& operator=(const PipeChannel&) = delete;

    PipeChannel(PipeChannel&& other) noexcept;
    PipeChannel& operator=(PipeChannel&& other) noexcept;

    /**
     * @brief Create the pipe
     *
     * Both ends are created close-on-exec; a spawner that hands an end to
     * a new program clears the flag on that end only.
     */
    [[nodiscard]] IPCResult<void> create();

    /**
     * @brief Take ownership of already-open descriptors
     * @param readFd Read end, or -1
     * @param writeFd Write end, or -1
     */
    void adopt(int readFd, int writeFd);

    /**
     * @brief Close both ends
     */
    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    /**
     * @brief Write a whole message
     * @return Success, ChannelClosed, MessageTooLarge or PipeError
     */
    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Receive the next message
     *
     * Waits at most @p timeout for the first byte. Once a header has
     * started arriving the rest of the frame is read to completion.
     *
     * @return The message, Timeout, ChannelClosed (peer gone) or an error
     */
    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Non-blocking readiness check
     */
    [[nodiscard]] bool hasData() const;

    [[nodiscard]] int getReadFd() const noexcept;
    [[nodiscard]] int getWriteFd() const noexcept;

    void closeRead();
    void closeWrite();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Which side of the channel the current process is on
 */
enum class ChannelRole { Unassigned, Parent, Child };

/**
 * @brief Full-duplex channel built from two pipes
 *
 * The parent writes on parent->child and reads on child->parent; the
 * child does the opposite. Outgoing messages are stamped with a sequence
 * number and the context id of the isolated side.
 */
class BidirectionalChannel {
public:
    BidirectionalChannel();
    ~BidirectionalChannel();

    BidirectionalChannel(const BidirectionalChannel&) = delete;
    BidirectionalChannel& operator=(const BidirectionalChannel&) = delete;

    /**
     * @brief Create both pipes
     *
     * Also makes sure a write to a dead peer reports EPIPE instead of
     * raising SIGPIPE in this process.
     */
    [[nodiscard]] IPCResult<void> create();

    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    /**
     * @brief Send a prepared message on this side's write end
     */
    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Build, stamp and send a message
     */
    [[nodiscard]] IPCResult<void> send(MessageType type, const json& payload);

    /**
     * @brief Receive on this side's read end
     */
    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Descriptors the child keeps: (read parent->child, write child->parent)
     */
    [[nodiscard]] std::pair<int, int> getSubprocessFds() const noexcept;

    /**
     * @brief Keep the parent ends and close the child ends
     */
    void setupParent();

    /**
     * @brief Keep the child ends and close the parent ends
     */
    void setupChild();

    /**
     * @brief Child side of a channel whose descriptors were inherited
     *        across exec
     */
    void adoptChild(int readFd, int writeFd);

    [[nodiscard]] ChannelRole role() const noexcept;

    /**
     * @brief Set the context id stamped on outgoing messages
     */
    void setContextId(uint32_t contextId) noexcept;

    [[nodiscard]] uint32_t contextId() const noexcept;

    /**
     * @brief Greet the child and wait for its acknowledgment
     *
     * The acknowledgment must echo the context id assigned through
     * setContextId(), otherwise HandshakeRejected is returned.
     *
     * @return Child identification or error
     */
    [[nodiscard]] IPCResult<HandshakePayload> performHandshake(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Send the acknowledgment from the child side
     */
    [[nodiscard]] IPCResult<void> respondToHandshake(
        const HandshakePayload& payload);

private:
    PipeChannel& outbound() noexcept;
    PipeChannel& inbound() noexcept;

    PipeChannel parentToChild_;   ///< Parent -> Child pipe
    PipeChannel childToParent_;   ///< Child -> Parent pipe
    std::atomic<uint32_t> sequenceId_{0};
    std::atomic<uint32_t> contextId_{0};
    std::atomic<ChannelRole> role_{ChannelRole::Unassigned};
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_CHANNEL_HPP
