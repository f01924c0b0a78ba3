/**
 * @file logger.cpp
 * @brief spdlog-backed logger for the middle server PCM relay
 */

#include "logging/logger.h"

#include <array>
#include <cctype>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace middle_server {
namespace logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
};

constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

// Accepted spellings besides the canonical names.
constexpr std::array<std::pair<std::string_view, LogLevel>, 4> kLevelAliases = {{
    {"warning", LogLevel::Warn},
    {"err", LogLevel::Error},
    {"fatal", LogLevel::Critical},
    {"none", LogLevel::Off},
}};

const LevelEntry& entryFor(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[2];  // info
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return entryFor(level).spdlogLevel;
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

spdlog::sink_ptr makeConsoleSink(const LogConfig& config) {
    std::shared_ptr<spdlog::sinks::sink> sink;
    if (config.consoleTarget == ConsoleTarget::Stdout) {
        auto colored = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            colored->set_color_mode(spdlog::color_mode::never);
        }
        sink = colored;
    } else {
        auto colored = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.coloredOutput) {
            colored->set_color_mode(spdlog::color_mode::never);
        }
        sink = colored;
    }
    sink->set_level(toSpdlogLevel(config.level));
    return sink;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire)) {
        if (g_logger) {
            g_logger->set_level(toSpdlogLevel(config.level));
            for (auto& sink : g_logger->sinks()) {
                sink->set_level(toSpdlogLevel(config.level));
            }
            g_logger->set_pattern(config.pattern);
        }
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            sinks.push_back(makeConsoleSink(config));
        }

        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        g_logger = std::make_shared<spdlog::logger>("middle_server", sinks.begin(), sinks.end());
        g_logger->set_level(toSpdlogLevel(config.level));
        g_logger->set_pattern(config.pattern);
        g_logger->flush_on(spdlog::level::err);

        spdlog::set_default_logger(g_logger);

        g_initialized.store(true, std::memory_order_release);

        LOG_DEBUG("Logging initialized (level={})", levelToString(config.level));
        if (!config.filePath.empty()) {
            LOG_INFO("Log file: {} (max {}MB x {} backups)", config.filePath,
                     config.maxFileSize / (1024 * 1024), config.maxBackups);
        }

        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeEarly() {
    LogConfig config;
    config.consoleTarget = ConsoleTarget::Stderr;
    return initialize(config);
}

void applyLogSection(const nlohmann::json& section, LogConfig& config) {
    if (section.contains("level")) {
        config.level = stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath")) {
        config.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize")) {
        config.maxFileSize = section["maxFileSize"].get<std::size_t>();
    }
    if (section.contains("maxBackups")) {
        config.maxBackups = section["maxBackups"].get<std::size_t>();
    }
    if (section.contains("consoleOutput")) {
        config.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("consoleTarget")) {
        const auto target = section["consoleTarget"].get<std::string>();
        config.consoleTarget = (target == "stdout") ? ConsoleTarget::Stdout : ConsoleTarget::Stderr;
    }
    if (section.contains("coloredOutput")) {
        config.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern")) {
        config.pattern = section["pattern"].get<std::string>();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(level));
        }
        LOG_DEBUG("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (const auto& entry : kLevels) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    for (const auto& alias : kLevelAliases) {
        if (alias.first == lower) {
            return alias.second;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace middle_server
