/**
 * @file logger.h
 * @brief Structured logging API for the middle server PCM relay
 *
 * Thin wrapper around spdlog. One process-wide logger with an optional
 * console sink (stdout or stderr) and an optional rotating file sink.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace middle_server {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Per-chunk relay activity
    Debug,     // Debug information
    Info,      // General information (delay transitions, session start/stop)
    Warn,      // Warnings
    Error,     // Errors
    Critical,  // Critical errors
    Off        // Disable logging
};

// Where the console sink writes. Stderr keeps stdout free for relayed PCM.
enum class ConsoleTarget : std::uint8_t { Stdout, Stderr };

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";  // Empty = no file output
    std::size_t maxFileSize = static_cast<std::size_t>(10 * 1024 * 1024);  // 10 MB
    std::size_t maxBackups = 5;
    bool consoleOutput = true;
    ConsoleTarget consoleTarget = ConsoleTarget::Stderr;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again after a successful initialization only updates the level
 * and pattern; sinks are kept.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used before the config file has been read. Re-initialize with the loaded
 * LogConfig (after shutdown()) for file sinks and the configured console.
 */
bool initializeEarly();

/**
 * @brief Apply the keys of a "logging" JSON object onto @p config
 *
 * Unknown keys are ignored. Throws nlohmann::json::exception on type mismatch.
 */
void applyLogSection(const nlohmann::json& section, LogConfig& config);

// Flushes pending messages and drops the logger.
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Get the underlying spdlog logger
 *
 * Lazily initializes with defaults when nothing has been set up yet.
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace middle_server

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

// Expands to one spdlog logger macro call on the project logger. The
// per-level spdlog macros keep SPDLOG_ACTIVE_LEVEL compile-time filtering.
#define MIDDLE_SERVER_LOG_WITH(spdlog_macro, ...)                            \
    do {                                                                     \
        if (auto ms_logger_ = middle_server::logging::getLogger()) {         \
            spdlog_macro(ms_logger_, __VA_ARGS__);                           \
        }                                                                    \
    } while (0)

#define LOG_TRACE(...) MIDDLE_SERVER_LOG_WITH(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) MIDDLE_SERVER_LOG_WITH(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) MIDDLE_SERVER_LOG_WITH(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) MIDDLE_SERVER_LOG_WITH(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) MIDDLE_SERVER_LOG_WITH(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) MIDDLE_SERVER_LOG_WITH(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// First call and every n-th call after it, per call site.
#define LOG_EVERY_N(level, n, ...)                                           \
    do {                                                                     \
        static std::atomic<std::uint64_t> ms_every_n_{0};                    \
        if (ms_every_n_.fetch_add(1, std::memory_order_relaxed) % (n) == 0) { \
            LOG_##level(__VA_ARGS__);                                        \
        }                                                                    \
    } while (0)

// At most once per call site for the process lifetime.
#define LOG_ONCE(level, ...)                                                 \
    do {                                                                     \
        static std::atomic_flag ms_once_ = ATOMIC_FLAG_INIT;                 \
        if (!ms_once_.test_and_set()) {                                      \
            LOG_##level(__VA_ARGS__);                                        \
        }                                                                    \
    } while (0)
