/*
 * logger.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/*************************************************

Date: 2024-11-28

Description: spdlog setup shared by the controller and the worker

**************************************************/

#ifndef WARDEN_LOGGING_LOGGER_HPP
#define WARDEN_LOGGING_LOGGER_HPP

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace warden::logging {

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool consoleEnabled{true};
    bool fileEnabled{false};
    std::string filePath{"logs/warden.log"};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> LoggingConfig;
};

/**
 * @brief Parse a level name, falling back to info for unknown names
 */
[[nodiscard]] auto logLevelFromString(std::string_view name)
    -> spdlog::level::level_enum;

[[nodiscard]] auto logLevelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Build the configured sinks and install them as the default logger
 *
 * Loggers created afterwards through getLogger() share the same sinks.
 * Calling it again replaces the sinks for loggers created from then on.
 */
void initialize(const LoggingConfig& config);

/**
 * @brief Get or create a named logger
 */
auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Flush and drop every logger
 */
void shutdown();

}  // namespace warden::logging

#endif  // WARDEN_LOGGING_LOGGER_HPP
