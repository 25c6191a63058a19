/*
 * types.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file types.hpp
 * @brief Sandbox type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_TYPES_HPP
#define WARDEN_SANDBOX_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sandbox {

using json = nlohmann::json;

/**
 * @brief Available isolation backends
 */
enum class SandboxKind {
    Worker,   ///< Persistent worker process, recreated after every call
    Context   ///< Disposable forked context, one per call
};

/**
 * @brief Get string representation of SandboxKind
 */
[[nodiscard]] constexpr std::string_view sandboxKindToString(SandboxKind kind) noexcept {
    switch (kind) {
        case SandboxKind::Worker: return "worker";
        case SandboxKind::Context: return "context";
    }
    return "unknown";
}

/**
 * @brief Error codes for sandbox operations
 */
enum class SandboxErrorCode {
    Success = 0,
    AlreadyExecuting,
    Timeout,
    Terminated,
    WorkerUnavailable,
    SpawnFailed,
    HandshakeFailed,
    ProtocolError,
    InvalidConfiguration,
    UnknownError
};

/**
 * @brief Get string representation of SandboxErrorCode
 */
[[nodiscard]] constexpr std::string_view sandboxErrorToString(SandboxErrorCode error) noexcept {
    switch (error) {
        case SandboxErrorCode::Success: return "Success";
        case SandboxErrorCode::AlreadyExecuting: return "Another execution is already in progress";
        case SandboxErrorCode::Timeout: return "Execution timeout";
        case SandboxErrorCode::Terminated: return "Execution terminated";
        case SandboxErrorCode::WorkerUnavailable: return "Sandbox worker unavailable";
        case SandboxErrorCode::SpawnFailed: return "Failed to spawn sandbox process";
        case SandboxErrorCode::HandshakeFailed: return "Handshake with sandbox process failed";
        case SandboxErrorCode::ProtocolError: return "Sandbox protocol error";
        case SandboxErrorCode::InvalidConfiguration: return "Invalid configuration";
        case SandboxErrorCode::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for internal sandbox operations
 */
template<typename T>
using SandboxResult = std::expected<T, SandboxErrorCode>;

/**
 * @brief Failure of the controller/sandbox protocol itself
 *
 * Raised through the future returned by executeCode (timeout, termination,
 * concurrent misuse, lost worker) and by configuration helpers. Failures
 * of the executed code are never reported this way.
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(SandboxErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    explicit SandboxError(SandboxErrorCode code)
        : SandboxError(code, std::string(sandboxErrorToString(code))) {}

    [[nodiscard]] SandboxErrorCode code() const noexcept { return code_; }

private:
    SandboxErrorCode code_;
};

/**
 * @brief Parse a backend name
 *
 * "iframe" is accepted as an alias of "context".
 *
 * @throws SandboxError InvalidConfiguration for unknown names
 */
[[nodiscard]] SandboxKind sandboxKindFromString(std::string_view name);

/**
 * @brief Limit that ended a run
 */
enum class LimitViolation {
    Memory,
    ExecutionTime,
    NetworkRequests
};

[[nodiscard]] constexpr std::string_view limitViolationToString(LimitViolation violation) noexcept {
    switch (violation) {
        case LimitViolation::Memory: return "Memory limit exceeded";
        case LimitViolation::ExecutionTime: return "Execution time limit exceeded";
        case LimitViolation::NetworkRequests: return "Network request limit exceeded";
    }
    return "Limit exceeded";
}

/**
 * @brief Resource ceilings of a sandbox instance
 *
 * Zero means unlimited for memory, network, storage and executionTime.
 */
struct ResourceLimits {
    static constexpr uint64_t DEFAULT_MEMORY = 100 * 1024 * 1024;
    static constexpr int DEFAULT_CPU = 80;
    static constexpr uint64_t DEFAULT_NETWORK = 10 * 1024 * 1024;
    static constexpr uint64_t DEFAULT_STORAGE = 50 * 1024 * 1024;
    static constexpr std::chrono::milliseconds DEFAULT_EXECUTION_TIME{30000};

    uint64_t memory{DEFAULT_MEMORY};    ///< Bytes of resident memory
    int cpu{DEFAULT_CPU};               ///< Percent ceiling, advisory
    uint64_t network{DEFAULT_NETWORK};  ///< Byte budget, advisory
    uint64_t storage{DEFAULT_STORAGE};  ///< Bytes a run may write
    std::chrono::milliseconds executionTime{DEFAULT_EXECUTION_TIME};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static ResourceLimits fromJson(const json& j);

    bool operator==(const ResourceLimits&) const = default;
};

/**
 * @brief Partial update for limitResources
 */
struct ResourceLimitsPatch {
    std::optional<uint64_t> memory;
    std::optional<int> cpu;
    std::optional<uint64_t> network;
    std::optional<uint64_t> storage;
    std::optional<std::chrono::milliseconds> executionTime;
};

/**
 * @brief Per-call input
 */
struct ExecutionContext {
    std::optional<std::chrono::milliseconds> timeout;  ///< Overrides the default timeout
    bool networkAccess{true};          ///< Allow fetch to reach the network handler
    json values = json::object();      ///< Caller fields visible to guest code as `context`
};

/**
 * @brief Observed cost of a run
 */
struct ExecutionMetrics {
    std::chrono::milliseconds executionTime{0};
    uint64_t memoryUsage{0};   ///< Bytes
    double cpuUsage{0.0};      ///< Percent of one core
    uint32_t networkRequests{0};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief One forwarded console line
 */
struct ConsoleEntry {
    std::string level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Terminal outcome of one executeCode call
 */
struct ExecutionResult {
    bool success{false};
    json output;                        ///< Return value of the code (success)
    std::string error;                  ///< Failure description
    std::optional<std::string> stack;   ///< Traceback of an application error
    ExecutionMetrics metrics;
    std::vector<std::string> warnings;
    std::vector<ConsoleEntry> logs;

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Receives every console line forwarded during a call
 */
using ConsoleCallback = std::function<void(const ConsoleEntry& entry)>;

/**
 * @brief Outbound request relayed from guest fetch
 */
struct NetworkRequest {
    std::string url;
    std::string method{"GET"};
    json headers = json::object();
    std::string body;
};

/**
 * @brief Answer handed back to guest fetch
 */
struct NetworkResponse {
    bool ok{false};
    int status{0};
    json headers = json::object();
    std::string body;
    std::string error;
};

/**
 * @brief Serves guest fetch calls on the controller side
 */
using NetworkHandler = std::function<NetworkResponse(const NetworkRequest& request)>;

/**
 * @brief Handler used when none is installed: every request is denied
 */
[[nodiscard]] NetworkResponse denyNetworkRequest(const NetworkRequest& request);

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_TYPES_HPP
