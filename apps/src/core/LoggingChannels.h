#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace NeuroEvo {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Cortex, Evolution, Orchestrator, Persistence, Species };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Cortex:
            return "cortex";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Orchestrator:
            return "orchestrator";
        case LogChannel::Persistence:
            return "persistence";
        case LogChannel::Species:
            return "species";
    }
    return "";
}

/**
 * @brief Named loggers per subsystem sharing one console sink and one file sink.
 *
 * Lets the actor runtime be traced message by message without flooding the
 * output of a long evolution run.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Level for console output
     * @param fileLevel Level for the neuroevo.log file
     * @param componentName Prefix added to every line (omitted for "default")
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize from a JSON config file, preferring <configPath>.local.
     * Falls back to built-in defaults when neither file exists.
     * @return true if a config file was read
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    /**
     * @brief Get a channel logger, initializing with defaults on first use.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "cortex:trace" - Trace every actor message
     *   "*:off,evolution:info" - Only generation summaries
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void initializeLocked(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& componentName,
        const std::string& logPath,
        bool truncate);

    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static nlohmann::json defaultConfig();
    static nlohmann::json loadConfigFile(const std::string& configPath, bool& fromFile);

    static std::atomic<bool> initialized_;
    static std::mutex initMutex_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::NeuroEvo::LoggingChannels::get(::NeuroEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::NeuroEvo::LoggingChannels::get(::NeuroEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::NeuroEvo::LoggingChannels::get(::NeuroEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::NeuroEvo::LoggingChannels::get(::NeuroEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::NeuroEvo::LoggingChannels::get(::NeuroEvo::LogChannel::channel), __VA_ARGS__)

// Default logger, no channel name in the output.
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace NeuroEvo
