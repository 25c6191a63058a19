/*
 * logger.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "logger.hpp"

#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden::logging {

namespace {

std::mutex gMutex;
std::vector<spdlog::sink_ptr> gSinks;
std::vector<std::string> gNames;
LoggingConfig gConfig;
bool gInitialized = false;

}  // namespace

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {
        {"level", logLevelToString(level)},
        {"pattern", pattern},
        {"console", consoleEnabled},
        {"file", fileEnabled},
        {"filePath", filePath}
    };
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    if (j.contains("level")) {
        config.level = logLevelFromString(j["level"].get<std::string>());
    }
    config.pattern = j.value("pattern", config.pattern);
    config.consoleEnabled = j.value("console", config.consoleEnabled);
    config.fileEnabled = j.value("file", config.fileEnabled);
    config.filePath = j.value("filePath", config.filePath);
    return config;
}

auto logLevelFromString(std::string_view name) -> spdlog::level::level_enum {
    if (name == "warn") {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

auto logLevelToString(spdlog::level::level_enum level) -> std::string {
    auto view = spdlog::level::to_string_view(level);
    return std::string(view.data(), view.size());
}

void initialize(const LoggingConfig& config) {
    std::lock_guard lock(gMutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleEnabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(config.pattern);
        sinks.push_back(std::move(console));
    }
    if (config.fileEnabled && !config.filePath.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.filePath, false);
            file->set_pattern(config.pattern);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Failed to open log file {}: {}", config.filePath,
                          e.what());
        }
    }

    auto logger =
        std::make_shared<spdlog::logger>("warden", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(config.level);

    gSinks = std::move(sinks);
    gConfig = config;
    gInitialized = true;
}

auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(gMutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> logger;
    if (gInitialized) {
        logger = std::make_shared<spdlog::logger>(name, gSinks.begin(),
                                                  gSinks.end());
        logger->set_level(gConfig.level);
    } else {
        // Before initialize(), follow whatever the default logger writes to
        auto& defaultSinks = spdlog::default_logger_raw()->sinks();
        logger = std::make_shared<spdlog::logger>(name, defaultSinks.begin(),
                                                  defaultSinks.end());
        logger->set_level(spdlog::default_logger_raw()->level());
    }

    spdlog::register_logger(logger);
    gNames.push_back(name);
    return logger;
}

void shutdown() {
    std::lock_guard lock(gMutex);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
    // The default logger stays installed so free spdlog calls remain valid
    for (const auto& name : gNames) {
        spdlog::drop(name);
    }
    gNames.clear();
    gSinks.clear();
    gInitialized = false;
}

}  // namespace warden::logging
