/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the standard drsid configuration. The only sink is the
 * console on stderr, so stdout carries tool output alone and nothing is
 * written to disk.
 *
 * @date 2026-10-19
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <optional>
#include <string>
#include <memory>

namespace drsid::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to an spdlog level
     * @param level trace, debug, info, warn, error, critical or off
     * @return spdlog level, or std::nullopt for an unknown name
     */
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return std::nullopt;
    }

    /**
     * @brief Initialize the default logger
     * @param name Logger name (e.g., "drsid-uuid")
     * @param logLevel Log level; unknown names fall back to warn
     */
    static void initialize(const std::string& name, const std::string& logLevel = "warn") {
        try {
            // Console sink (colored, stderr)
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

            auto logger = std::make_shared<spdlog::logger>(name, consoleSink);
            logger->set_level(parseLevel(logLevel).value_or(spdlog::level::warn));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}", name, logLevel);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }
};

} // namespace drsid::common
