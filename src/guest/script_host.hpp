/*
 * script_host.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file script_host.hpp
 * @brief Runs guest code in a narrowed interpreter scope
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_GUEST_SCRIPT_HOST_HPP
#define WARDEN_GUEST_SCRIPT_HOST_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../sandbox/metrics_monitor.hpp"
#include "../sandbox/types.hpp"

namespace warden::guest {

using json = nlohmann::json;

/**
 * @brief Ways out of the guest scope, provided by the process runtime
 */
struct GuestBridge {
    /// Forward one console line
    std::function<void(std::string_view level, std::string_view message)> console;

    /// Relay a fetch to the controller; nullopt when the relay failed
    std::function<std::optional<sandbox::NetworkResponse>(
        const sandbox::NetworkRequest& request)>
        fetch;

    /// Report an unraisable error not tied to the call's outcome
    std::function<void(std::string_view error, std::string_view stack)> diagnostic;
};

/**
 * @brief Per-run switches of the guest scope
 */
struct ScriptHostOptions {
    uint32_t networkRequestCap{10};
    bool networkAccess{true};
};

/**
 * @brief Outcome of one guest run
 */
struct RunOutcome {
    bool success{false};
    json result;                        ///< Return value (success)
    std::string error;                  ///< "Type: message" (failure)
    std::optional<std::string> stack;   ///< Formatted traceback (failure)
    bool networkLimitHit{false};        ///< fetch went past the cap at least once
};

/**
 * @brief Executes guest code inside a restricted global scope
 *
 * The code is compiled as the body of a function so a top-level `return`
 * produces the result. The scope only carries an allow-list of builtins,
 * the console and fetch shims, `sleep`, the math/json/datetime/re proxies
 * and the caller's `context`. Every run gets fresh globals.
 *
 * The interpreter must be initialized and the calling thread must hold
 * the GIL.
 */
class ScriptHost {
public:
    ScriptHost(GuestBridge bridge, sandbox::MetricsMonitor& monitor,
               ScriptHostOptions options = {});
    ~ScriptHost();

    ScriptHost(const ScriptHost&) = delete;
    ScriptHost& operator=(const ScriptHost&) = delete;

    /**
     * @brief Run guest code
     * @param code Sanitized code
     * @param context Value bound to the global `context`
     */
    [[nodiscard]] RunOutcome run(std::string_view code, const json& context);

    /**
     * @brief Load every stdlib module the scope may need later
     *
     * Guest frames cannot import, so lazily imported helpers must already
     * be in sys.modules.
     */
    static void preloadModules();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::guest

#endif  // WARDEN_GUEST_SCRIPT_HOST_HPP
