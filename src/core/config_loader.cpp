#include "core/config_loader.h"

#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace middle_server {

namespace {

ConfigResult fail(ErrorCode code, std::string reason, bool verbose) {
    if (verbose) {
        LOG_ERROR("Config: {}", reason);
    }
    return {code, std::move(reason)};
}

// Integer fields are read without conversion: "10", 3.9 and true are rejected
// instead of being coerced.
bool readInt(const nlohmann::json& section, const char* key, int& out) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        return false;
    }
    const auto v = value.get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

}  // namespace

ConfigResult loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                           bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return {ErrorCode::CONFIG_FILE_NOT_FOUND, configPath.string() + " not found"};
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return fail(ErrorCode::CONFIG_PARSE_FAILED,
                    "failed to parse " + configPath.string() + ": " + e.what(), verbose);
    }
    if (!j.is_object()) {
        return fail(ErrorCode::CONFIG_PARSE_FAILED,
                    configPath.string() + ": top level must be a JSON object", verbose);
    }

    try {
        if (j.contains("delay") && j["delay"].is_object()) {
            const auto& delay = j["delay"];
            if (delay.contains("threshold")) {
                if (!delay["threshold"].is_number_integer()) {
                    outConfig = AppConfig{};
                    return fail(ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD,
                                "delay.threshold is not an integer: " + delay["threshold"].dump(),
                                verbose);
                }
                outConfig.delay.threshold = delay["threshold"].get<std::int64_t>();
            }
            if (!readInt(delay, "compensationMs", outConfig.delay.compensationMs)) {
                outConfig = AppConfig{};
                return fail(ErrorCode::CONFIG_INVALID_VALUE,
                            "delay.compensationMs is not an integer: " +
                                delay["compensationMs"].dump(),
                            verbose);
            }
        }

        if (j.contains("relay") && j["relay"].is_object()) {
            const auto& relay = j["relay"];
            if (relay.contains("chunkFrames")) {
                if (!relay["chunkFrames"].is_number_unsigned()) {
                    outConfig = AppConfig{};
                    return fail(ErrorCode::CONFIG_INVALID_VALUE,
                                "relay.chunkFrames must be a non-negative integer: " +
                                    relay["chunkFrames"].dump(),
                                verbose);
                }
                outConfig.relay.chunkFrames = relay["chunkFrames"].get<std::size_t>();
            }
            if (relay.contains("realtimePacing")) {
                if (!relay["realtimePacing"].is_boolean()) {
                    outConfig = AppConfig{};
                    return fail(ErrorCode::CONFIG_INVALID_VALUE,
                                "relay.realtimePacing must be true or false", verbose);
                }
                outConfig.relay.realtimePacing = relay["realtimePacing"].get<bool>();
            }
            if (!readInt(relay, "statusIntervalMs", outConfig.relay.statusIntervalMs)) {
                outConfig = AppConfig{};
                return fail(ErrorCode::CONFIG_INVALID_VALUE,
                            "relay.statusIntervalMs is not an integer: " +
                                relay["statusIntervalMs"].dump(),
                            verbose);
            }
        }

        if (j.contains("audio") && j["audio"].is_object()) {
            auto audio = j["audio"];
            try {
                AudioInfo parsed;
                if (audio.contains("channels")) {
                    parsed.channels = audio["channels"].get<uint16_t>();
                }
                if (audio.contains("sampleRate")) {
                    parsed.sampleRate = audio["sampleRate"].get<uint32_t>();
                }
                if (audio.contains("bitsPerSample")) {
                    parsed.bitsPerSample = audio["bitsPerSample"].get<uint16_t>();
                }
                if (audio.contains("pcmFormat")) {
                    parsed.pcmFormat = audio["pcmFormat"].get<std::string>();
                }
                outConfig.audio = parsed;
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid audio settings, using defaults: {}", e.what());
                }
            }
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            try {
                logging::applyLogSection(j["logging"], outConfig.logging);
            } catch (const std::exception& e) {
                outConfig.logging = logging::LogConfig{};
                if (verbose) {
                    LOG_WARN("Config: Invalid logging settings, using defaults: {}", e.what());
                }
            }
        }

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return {};
    } catch (const std::exception& e) {
        outConfig = AppConfig{};
        return fail(ErrorCode::CONFIG_PARSE_FAILED,
                    "failed to read " + configPath.string() + ": " + e.what(), verbose);
    }
}

ConfigResult validateAppConfig(const AppConfig& config) {
    if (config.delay.threshold < 0) {
        return {ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD,
                "delay threshold must be >= 0 (got " + std::to_string(config.delay.threshold) +
                    ")"};
    }
    if (config.delay.compensationMs < 0) {
        return {ErrorCode::CONFIG_INVALID_VALUE, "delay compensation must be >= 0 ms"};
    }
    if (config.relay.chunkFrames == 0) {
        return {ErrorCode::CONFIG_INVALID_VALUE, "chunk frames must be > 0"};
    }
    if (config.relay.chunkFrames > MAX_CHUNK_FRAMES) {
        return {ErrorCode::CONFIG_INVALID_VALUE,
                "chunk frames must be <= " + std::to_string(MAX_CHUNK_FRAMES) + " (got " +
                    std::to_string(config.relay.chunkFrames) + ")"};
    }
    if (config.relay.statusIntervalMs < 0) {
        return {ErrorCode::CONFIG_INVALID_VALUE, "status interval must be >= 0 ms"};
    }
    auto audio = validateAudioInfo(config.audio);
    if (!audio.ok) {
        return {ErrorCode::RELAY_INVALID_AUDIO_INFO, audio.reason};
    }
    return {};
}

}  // namespace middle_server
