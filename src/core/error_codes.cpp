#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace middle_server {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Relay / PCM stream
    {ErrorCode::RELAY_INVALID_AUDIO_INFO, "RELAY_INVALID_AUDIO_INFO"},
    {ErrorCode::RELAY_SOURCE_OPEN_FAILED, "RELAY_SOURCE_OPEN_FAILED"},
    {ErrorCode::RELAY_SOURCE_READ_FAILED, "RELAY_SOURCE_READ_FAILED"},
    {ErrorCode::RELAY_SINK_OPEN_FAILED, "RELAY_SINK_OPEN_FAILED"},
    {ErrorCode::RELAY_SINK_WRITE_FAILED, "RELAY_SINK_WRITE_FAILED"},
    {ErrorCode::RELAY_STOPPED, "RELAY_STOPPED"},

    // Configuration / validation
    {ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD, "CONFIG_INVALID_DELAY_THRESHOLD"},
    {ErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE"},
    {ErrorCode::CONFIG_FILE_NOT_FOUND, "CONFIG_FILE_NOT_FOUND"},
    {ErrorCode::CONFIG_PARSE_FAILED, "CONFIG_PARSE_FAILED"},
    {ErrorCode::CONFIG_UNKNOWN_ARGUMENT, "CONFIG_UNKNOWN_ARGUMENT"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// Reverse lookup, built once from the forward table
static const std::unordered_map<std::string, ErrorCode>& stringTable() {
    static const std::unordered_map<std::string, ErrorCode> table = [] {
        std::unordered_map<std::string, ErrorCode> reverse;
        for (const auto& entry : kErrorCodeStrings) {
            reverse.emplace(entry.second, entry.first);
        }
        return reverse;
    }();
    return table;
}

ConfigError::ConfigError(ErrorCode code, const std::string& message)
    : std::invalid_argument(errorCodeToHex(code) + " " + errorCodeToString(code) + ": " +
                            message),
      code_(code) {}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isRelayError(code)) {
        return "relay";
    }
    if (isConfigError(code)) {
        return "config";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    const auto& table = stringTable();
    auto it = table.find(str);
    if (it != table.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace middle_server
