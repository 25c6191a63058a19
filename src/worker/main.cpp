/**
 * @file main.cpp
 * @brief Entry point of warden-worker, the persistent sandbox process
 *
 * The controller starts the worker with the two pipe descriptors it
 * inherited: warden-worker <read-fd> <write-fd>. The worker answers the
 * handshake, then runs Execute requests until it is told to shut down or
 * the controller goes away.
 */

#include "guest/guest_runtime.hpp"
#include "guest/interpreter.hpp"
#include "guest/process_hardening.hpp"
#include "guest/script_host.hpp"
#include "ipc/channel.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string_view>

namespace {

std::optional<int> parseDescriptor(std::string_view text) {
    int fd = -1;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), fd);
    if (ec != std::errc{} || end != text.data() + text.size() || fd < 0) {
        return std::nullopt;
    }
    return fd;
}

void configureLogging() {
    if (std::getenv("WARDEN_WORKER_DEBUG") != nullptr) {
        auto logger = spdlog::stderr_color_mt("warden-worker");
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    } else {
        spdlog::set_level(spdlog::level::off);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::fprintf(stderr, "Usage: %s <read-fd> <write-fd>\n", argv[0]);
        return 2;
    }

    auto readFd = parseDescriptor(argv[1]);
    auto writeFd = parseDescriptor(argv[2]);
    if (!readFd || !writeFd) {
        std::fprintf(stderr, "warden-worker: invalid descriptor arguments\n");
        return 2;
    }

    configureLogging();

    try {
        warden::guest::closeInheritedDescriptors({*readFd, *writeFd});

        if (auto hardened = warden::guest::applyBaseline({}); !hardened) {
            spdlog::error("Hardening failed: {}",
                          warden::sandbox::sandboxErrorToString(hardened.error()));
            return 1;
        }

        warden::ipc::BidirectionalChannel channel;
        channel.adoptChild(*readFd, *writeFd);

        warden::guest::InterpreterScope interpreter;
        warden::guest::ScriptHost::preloadModules();

        warden::guest::GuestRuntime runtime(channel);
        int code = runtime.serve();
        spdlog::debug("Worker exiting with {}", code);
        return code;
    } catch (const std::exception& e) {
        spdlog::critical("Worker failed: {}", e.what());
        std::fprintf(stderr, "warden-worker: %s\n", e.what());
        return 1;
    }
}
