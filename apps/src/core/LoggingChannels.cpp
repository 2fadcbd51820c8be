#include "LoggingChannels.h"
#include "Assert.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace NeuroEvo {

std::atomic<bool> LoggingChannels::initialized_{ false };
std::mutex LoggingChannels::initMutex_;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

namespace {
constexpr const char* kDefaultLogPath = "neuroevo.log";
constexpr LogChannel kAllChannels[] = {
    LogChannel::Cortex,
    LogChannel::Evolution,
    LogChannel::Orchestrator,
    LogChannel::Persistence,
    LogChannel::Species,
};

std::string trim(std::string value)
{
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    return value;
}
} // namespace

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex_);
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }
    initializeLocked(consoleLevel, fileLevel, componentName, kDefaultLogPath, true);
}

void LoggingChannels::initializeLocked(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    const std::string& logPath,
    bool truncate)
{
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath, truncate);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    const std::string pattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] [%s:%#] %v";
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    // Actor traffic is noisy, keep it quiet unless asked for.
    createLogger("cortex", sharedSinks_, spdlog::level::warn);
    createLogger("evolution", sharedSinks_, spdlog::level::info);
    createLogger("orchestrator", sharedSinks_, spdlog::level::info);
    createLogger("persistence", sharedSinks_, spdlog::level::info);
    createLogger("species", sharedSinks_, spdlog::level::info);

    // Default logger gets its own sinks so its pattern can omit the channel name.
    auto default_console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    default_console_sink->set_level(consoleLevel);
    auto default_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath, false);
    default_file_sink->set_level(fileLevel);

    const std::string defaultPattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
    default_console_sink->set_pattern(defaultPattern);
    default_file_sink->set_pattern(defaultPattern);

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { default_console_sink, default_file_sink };
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Unit tests built on gtest_main never call initialize().
    if (!initialized_) {
        std::lock_guard<std::mutex> lock(initMutex_);
        if (!initialized_) {
            initializeLocked(
                spdlog::level::info, spdlog::level::debug, "default", kDefaultLogPath, true);
        }
    }

    auto logger = spdlog::get(toString(channel));
    NEUROEVO_ASSERT(logger, "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (const LogChannel each : kAllChannels) {
                setChannelLevel(each, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    for (const LogChannel each : kAllChannels) {
        if (channel == toString(each)) {
            setChannelLevel(each, level);
            return;
        }
    }
    spdlog::warn("Unknown log channel '{}'", channel);
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "console_level", "info" },
        { "file_level", "debug" },
        { "file_path", kDefaultLogPath },
        { "truncate", true },
        { "channels",
          { { "cortex", "warn" },
            { "evolution", "info" },
            { "orchestrator", "info" },
            { "persistence", "info" },
            { "species", "info" } } },
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath, bool& fromFile)
{
    namespace fs = std::filesystem;

    fromFile = false;
    const std::string localPath = configPath + ".local";
    std::string pathToUse;
    if (fs::exists(localPath)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open logging config {}, using defaults", pathToUse);
            return defaultConfig();
        }
        nlohmann::json config = defaultConfig();
        config.merge_patch(nlohmann::json::parse(configFile));
        fromFile = true;
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Invalid logging config {}: {}, using defaults", pathToUse, e.what());
        return defaultConfig();
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex_);
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    bool fromFile = false;
    const nlohmann::json config = loadConfigFile(configPath, fromFile);

    initializeLocked(
        parseLevelString(config.value("console_level", std::string("info"))),
        parseLevelString(config.value("file_level", std::string("debug"))),
        componentName,
        config.value("file_path", std::string(kDefaultLogPath)),
        config.value("truncate", true));

    if (config.contains("channels") && config["channels"].is_object()) {
        for (const auto& [channel, level] : config["channels"].items()) {
            if (level.is_string()) {
                setChannelLevel(channel, parseLevelString(level.get<std::string>()));
            }
        }
    }

    return fromFile;
}

} // namespace NeuroEvo
