#ifndef MIDDLE_SERVER_CONFIG_LOADER_H
#define MIDDLE_SERVER_CONFIG_LOADER_H

#include "audio/audio_info.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace middle_server {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct DelayConfig {
        // Number of sent chunks at which delay compensation kicks in (DELAY_THRESHOLD).
        // Signed so that a negative value from any source can be reported instead of wrapped.
        std::int64_t threshold = 10;
        // Compensation wait applied to the chunk sent while Enabled. 0 = one chunk duration.
        int compensationMs = 0;
    } delay;

    AudioInfo audio;

    struct RelayConfig {
        std::size_t chunkFrames = 4800;  // 100 ms at 48 kHz
        bool realtimePacing = false;
        int statusIntervalMs = 0;  // 0 = no periodic status log
    } relay;

    logging::LogConfig logging;
};

// Upper bound for relay.chunkFrames: 10 s at the highest allowed rate.
constexpr std::size_t MAX_CHUNK_FRAMES = 192000 * 10;

struct ConfigResult {
    ErrorCode code{ErrorCode::OK};
    std::string reason;

    bool ok() const {
        return code == ErrorCode::OK;
    }
};

// Loads @p configPath over defaults.
//   CONFIG_FILE_NOT_FOUND           file missing, defaults kept
//   CONFIG_PARSE_FAILED             not valid JSON, defaults kept
//   CONFIG_INVALID_DELAY_THRESHOLD  delay.threshold is not an integer
//   CONFIG_INVALID_VALUE            a delay/relay number has the wrong type or sign
// Invalid audio and logging sections fall back to their defaults with a warning.
ConfigResult loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                           bool verbose = true);

// Checks cross-field constraints once every configuration layer is applied.
ConfigResult validateAppConfig(const AppConfig& config);

}  // namespace middle_server

#endif  // MIDDLE_SERVER_CONFIG_LOADER_H
