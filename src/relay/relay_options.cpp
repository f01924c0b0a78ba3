#include "relay/relay_options.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace middle_server {
namespace relay {

namespace {

bool parseBool(const std::string &value, bool &out) {
    if (value == "1" || value == "true" || value == "TRUE" || value == "on" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "FALSE" || value == "off" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt64(const std::string &text, std::int64_t &out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') {
        return false;
    }
    out = static_cast<std::int64_t>(value);
    return true;
}

bool parseInt(const std::string &text, int &out) {
    std::int64_t value = 0;
    if (!parseInt64(text, value) || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parseSize(const std::string &text, std::size_t &out) {
    std::int64_t value = 0;
    if (!parseInt64(text, value) || value < 0) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

template <typename T>
bool parseUnsignedField(const std::string &text, T &out) {
    std::int64_t value = 0;
    if (!parseInt64(text, value) || value < 0 ||
        static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

// The threshold is rejected here when negative so that the error surfaces
// before any DelayDecider is built.
bool parseThreshold(const std::string &source, const std::string &text, std::int64_t &out,
                    std::string &error) {
    std::int64_t value = 0;
    if (!parseInt64(text, value)) {
        error = source + " is not an integer: " + text;
        return false;
    }
    if (value < 0) {
        error = source + " must be >= 0: " + text;
        return false;
    }
    out = value;
    return true;
}

bool takesValue(const std::string &arg) {
    static const char *const kValueFlags[] = {
        "-c", "--config", "-i", "--input", "-o", "--output", "-t", "--delay-threshold",
        "--delay-compensation-ms", "--chunk-frames", "--channels", "--sample-rate",
        "--bits-per-sample", "--pcm-format", "--status-interval-ms", "-l", "--log-level",
        "--log-file",
    };
    for (const char *flag : kValueFlags) {
        if (arg == flag) {
            return true;
        }
    }
    return false;
}

template <typename Parser, typename T>
bool applyEnv(const char *name, T &target, Parser parser, std::string &error) {
    if (const char *env = std::getenv(name)) {
        if (!parser(env, target)) {
            error = std::string("environment variable ") + name + " has an invalid value: " + env;
            return false;
        }
    }
    return true;
}

}  // namespace

RelayOptions makeDefaultOptions() {
    return RelayOptions{};
}

std::string resolveConfigPath(int argc, char **argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-c" || arg == "--config") {
            return argv[i + 1];
        }
    }
    if (const char *env = std::getenv("MIDDLE_SERVER_CONFIG")) {
        return env;
    }
    return DEFAULT_CONFIG_FILE;
}

ConfigResult loadConfigFile(RelayOptions &options) {
    ConfigResult result = loadAppConfig(options.configPath, options.config, true);
    if (result.code == ErrorCode::CONFIG_FILE_NOT_FOUND &&
        options.configPath == DEFAULT_CONFIG_FILE) {
        return {};
    }
    return result;
}

bool applyEnvOverrides(RelayOptions &options, std::string &error) {
    AppConfig &cfg = options.config;

    if (const char *threshold = std::getenv("DELAY_THRESHOLD")) {
        if (!parseThreshold("DELAY_THRESHOLD", threshold, cfg.delay.threshold, error)) {
            return false;
        }
    }
    if (!applyEnv("MIDDLE_SERVER_DELAY_COMPENSATION_MS", cfg.delay.compensationMs, parseInt,
                  error)) {
        return false;
    }
    if (!applyEnv("MIDDLE_SERVER_CHUNK_FRAMES", cfg.relay.chunkFrames, parseSize, error)) {
        return false;
    }
    if (!applyEnv("MIDDLE_SERVER_CHANNELS", cfg.audio.channels, parseUnsignedField<uint16_t>,
                  error)) {
        return false;
    }
    if (!applyEnv("MIDDLE_SERVER_SAMPLE_RATE", cfg.audio.sampleRate, parseUnsignedField<uint32_t>,
                  error)) {
        return false;
    }
    if (!applyEnv("MIDDLE_SERVER_BITS_PER_SAMPLE", cfg.audio.bitsPerSample,
                  parseUnsignedField<uint16_t>, error)) {
        return false;
    }
    if (const char *format = std::getenv("MIDDLE_SERVER_PCM_FORMAT")) {
        cfg.audio.pcmFormat = format;
    }
    if (const char *realtime = std::getenv("MIDDLE_SERVER_REALTIME")) {
        if (!parseBool(realtime, cfg.relay.realtimePacing)) {
            error = "MIDDLE_SERVER_REALTIME must be true/false";
            return false;
        }
    }
    if (!applyEnv("MIDDLE_SERVER_STATUS_INTERVAL_MS", cfg.relay.statusIntervalMs, parseInt,
                  error)) {
        return false;
    }
    if (const char *level = std::getenv("MIDDLE_SERVER_LOG_LEVEL")) {
        cfg.logging.level = logging::stringToLevel(level);
    }
    if (const char *logFile = std::getenv("MIDDLE_SERVER_LOG_FILE")) {
        cfg.logging.filePath = logFile;
    }
    if (const char *input = std::getenv("MIDDLE_SERVER_INPUT")) {
        options.inputPath = input;
    }
    if (const char *output = std::getenv("MIDDLE_SERVER_OUTPUT")) {
        options.outputPath = output;
    }
    return true;
}

void printHelp(const char *exeName) {
    std::cout << "middle-server-relay\n";
    std::cout << "Usage: " << exeName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>        JSON config file (default: config.json)\n";
    std::cout << "  -i, --input <path>         raw PCM input, '-' for stdin (default: -)\n";
    std::cout << "  -o, --output <path>        output, '-' for stdout, 'null' to discard\n";
    std::cout << "  -t, --delay-threshold N    sends before delay compensation (DELAY_THRESHOLD)\n";
    std::cout << "  --delay-compensation-ms N  compensation wait, 0 = one chunk (default: 0)\n";
    std::cout << "  --chunk-frames N           frames per chunk (default: 4800)\n";
    std::cout << "  --channels N               channel count (default: 2)\n";
    std::cout << "  --sample-rate N            sample rate in Hz (default: 48000)\n";
    std::cout << "  --bits-per-sample N        16 or 32 (default: 16)\n";
    std::cout << "  --pcm-format FMT           s16le | f32le (default: s16le)\n";
    std::cout << "  --realtime                 pace chunks at playback speed\n";
    std::cout << "  --no-realtime              send as fast as the output accepts\n";
    std::cout << "  --status-interval-ms N     periodic status log, 0 = off (default: 0)\n";
    std::cout << "  -l, --log-level <lvl>      trace/debug/info/warn/error (default: info)\n";
    std::cout << "  --log-file <path>          rotating log file\n";
    std::cout << "  -h, --help                 Show this help\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char **argv, RelayOptions &options, bool &showHelp, std::string &error) {
    AppConfig &cfg = options.config;

    auto invalid = [&](const std::string &arg, const char *value) {
        error = "invalid value for " + arg + ": " + value;
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        const bool hasValue = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            showHelp = true;
            return false;
        }
        if ((arg == "-c" || arg == "--config") && hasValue) {
            options.configPath = argv[++i];
            continue;
        }
        if ((arg == "-i" || arg == "--input") && hasValue) {
            options.inputPath = argv[++i];
            continue;
        }
        if ((arg == "-o" || arg == "--output") && hasValue) {
            options.outputPath = argv[++i];
            continue;
        }
        if ((arg == "-t" || arg == "--delay-threshold") && hasValue) {
            if (!parseThreshold(arg, argv[++i], cfg.delay.threshold, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--delay-compensation-ms" && hasValue) {
            const char *value = argv[++i];
            if (!parseInt(value, cfg.delay.compensationMs)) {
                return invalid(arg, value);
            }
            continue;
        }
        if (arg == "--chunk-frames" && hasValue) {
            const char *value = argv[++i];
            if (!parseSize(value, cfg.relay.chunkFrames)) {
                return invalid(arg, value);
            }
            continue;
        }
        if (arg == "--channels" && hasValue) {
            const char *value = argv[++i];
            if (!parseUnsignedField(value, cfg.audio.channels)) {
                return invalid(arg, value);
            }
            continue;
        }
        if (arg == "--sample-rate" && hasValue) {
            const char *value = argv[++i];
            if (!parseUnsignedField(value, cfg.audio.sampleRate)) {
                return invalid(arg, value);
            }
            continue;
        }
        if (arg == "--bits-per-sample" && hasValue) {
            const char *value = argv[++i];
            if (!parseUnsignedField(value, cfg.audio.bitsPerSample)) {
                return invalid(arg, value);
            }
            continue;
        }
        if (arg == "--pcm-format" && hasValue) {
            cfg.audio.pcmFormat = argv[++i];
            continue;
        }
        if (arg == "--realtime") {
            cfg.relay.realtimePacing = true;
            continue;
        }
        if (arg == "--no-realtime") {
            cfg.relay.realtimePacing = false;
            continue;
        }
        if (arg == "--status-interval-ms" && hasValue) {
            const char *value = argv[++i];
            if (!parseInt(value, cfg.relay.statusIntervalMs)) {
                return invalid(arg, value);
            }
            continue;
        }
        if ((arg == "-l" || arg == "--log-level") && hasValue) {
            cfg.logging.level = logging::stringToLevel(argv[++i]);
            continue;
        }
        if (arg == "--log-file" && hasValue) {
            cfg.logging.filePath = argv[++i];
            continue;
        }

        if (!hasValue && takesValue(arg)) {
            error = "missing value for " + arg;
            return false;
        }

        error = std::string("unknown argument: ") + arg;
        printHelp(argv[0]);
        return false;
    }
    return true;
}

}  // namespace relay
}  // namespace middle_server
