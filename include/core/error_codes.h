#ifndef MIDDLE_SERVER_ERROR_CODES_H
#define MIDDLE_SERVER_ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace middle_server {

/**
 * @brief Error codes for the middle server relay.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Relay / PCM stream
 * - 0x5xxx: Configuration / validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Relay / PCM stream (0x1000)
    RELAY_INVALID_AUDIO_INFO = 0x1001,
    RELAY_SOURCE_OPEN_FAILED = 0x1002,
    RELAY_SOURCE_READ_FAILED = 0x1003,
    RELAY_SINK_OPEN_FAILED = 0x1004,
    RELAY_SINK_WRITE_FAILED = 0x1005,
    RELAY_STOPPED = 0x1006,

    // Configuration / validation (0x5000)
    CONFIG_INVALID_DELAY_THRESHOLD = 0x5001,
    CONFIG_INVALID_VALUE = 0x5002,
    CONFIG_FILE_NOT_FOUND = 0x5003,
    CONFIG_PARSE_FAILED = 0x5004,
    CONFIG_UNKNOWN_ARGUMENT = 0x5005,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Fatal configuration error raised while building relay components.
 *
 * Thrown for precondition violations that must reach the caller instead of
 * being clamped (e.g. a negative delay threshold).
 */
class ConfigError : public std::invalid_argument {
   public:
    ConfigError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept {
        return code_;
    }

   private:
    ErrorCode code_;
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "RELAY_SINK_WRITE_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return "ok", "relay", "config", or "internal" for anything else
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x5001").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isRelayError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isConfigError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

// Process exit status for the relay tool: 0 ok, 2 config, 1 everything else.
constexpr int toExitStatus(ErrorCode code) {
    if (code == ErrorCode::OK || code == ErrorCode::RELAY_STOPPED) {
        return 0;
    }
    return isConfigError(code) ? 2 : 1;
}

}  // namespace middle_server

#endif  // MIDDLE_SERVER_ERROR_CODES_H
