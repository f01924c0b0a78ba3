#include "core/config_loader.h"
#include "core/error_codes.h"
#include "delay/delay_decider.h"
#include "logging/logger.h"
#include "relay/pcm_endpoints.h"
#include "relay/pcm_relay_session.h"
#include "relay/relay_options.h"
#include "relay/session_status.h"
#include "relay/status_reporter.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

using namespace middle_server;

namespace {

std::atomic_bool *gStopFlag = nullptr;

void handleSignal(int) {
    if (gStopFlag) {
        gStopFlag->store(true, std::memory_order_relaxed);
    }
}

}  // namespace

int main(int argc, char **argv) {
    logging::initializeEarly();

    relay::RelayOptions options = relay::makeDefaultOptions();
    options.configPath = relay::resolveConfigPath(argc, argv);
    const ConfigResult loaded = relay::loadConfigFile(options);
    if (!loaded.ok()) {
        LOG_ERROR("[middle-server] cannot use config ({}): {}", errorCodeToString(loaded.code),
                  loaded.reason);
        return toExitStatus(loaded.code);
    }

    bool showHelp = false;
    std::string optionError;
    if (!relay::applyEnvOverrides(options, optionError)) {
        LOG_ERROR("{}", optionError);
        return toExitStatus(ErrorCode::CONFIG_INVALID_VALUE);
    }
    if (!relay::parseArgs(argc, argv, options, showHelp, optionError)) {
        if (!optionError.empty()) {
            LOG_ERROR("{}", optionError);
        }
        return showHelp ? 0 : toExitStatus(ErrorCode::CONFIG_UNKNOWN_ARGUMENT);
    }

    const ConfigResult validation = validateAppConfig(options.config);
    if (!validation.ok()) {
        LOG_ERROR("[middle-server] invalid configuration ({}): {}",
                  errorCodeToString(validation.code), validation.reason);
        return toExitStatus(validation.code);
    }

    // Re-create the logger so file sinks and console target from config apply.
    logging::shutdown();
    if (!logging::initialize(options.config.logging)) {
        std::cerr << "[middle-server] failed to initialize logging" << std::endl;
        return 1;
    }

    std::atomic_bool stopRequested{false};
    gStopFlag = &stopRequested;

    struct sigaction sa {};
    sa.sa_handler = handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    const AppConfig &cfg = options.config;
    LOG_INFO("[middle-server] start");
    LOG_INFO("  - config: {}", options.configPath);
    LOG_INFO("  - input:  {}", options.inputPath == "-" ? "<stdin>" : options.inputPath);
    LOG_INFO("  - output: {}", options.outputPath == "-" ? "<stdout>" : options.outputPath);
    LOG_INFO("  - audio:  {}", formatAudioInfo(cfg.audio));
    LOG_INFO("  - delay threshold: {}", cfg.delay.threshold);
    if (cfg.delay.compensationMs > 0) {
        LOG_INFO("  - delay compensation: {} ms", cfg.delay.compensationMs);
    } else {
        LOG_INFO("  - delay compensation: one chunk");
    }

    delay::DelayDeciderPtr decider;
    try {
        decider = delay::DelayDecider::create(cfg.delay.threshold);
    } catch (const ConfigError &e) {
        LOG_CRITICAL("[middle-server] {}", e.what());
        logging::shutdown();
        return toExitStatus(e.code());
    }

    std::string openError;
    auto source = relay::FdPcmSource::open(options.inputPath, openError);
    if (!source) {
        LOG_ERROR("[middle-server] {} ({})", openError,
                  errorCodeToString(ErrorCode::RELAY_SOURCE_OPEN_FAILED));
        logging::shutdown();
        return toExitStatus(ErrorCode::RELAY_SOURCE_OPEN_FAILED);
    }
    auto sink = relay::makeChunkSink(options.outputPath, openError);
    if (!sink) {
        LOG_ERROR("[middle-server] {} ({})", openError,
                  errorCodeToString(ErrorCode::RELAY_SINK_OPEN_FAILED));
        logging::shutdown();
        return toExitStatus(ErrorCode::RELAY_SINK_OPEN_FAILED);
    }

    relay::RelaySessionConfig sessionConfig;
    sessionConfig.audio = cfg.audio;
    sessionConfig.chunkFrames = cfg.relay.chunkFrames;
    sessionConfig.compensation = std::chrono::milliseconds(cfg.delay.compensationMs);
    sessionConfig.realtimePacing = cfg.relay.realtimePacing;

    relay::SessionStatus status;
    relay::StatusReporter reporter(status, decider,
                                   std::chrono::milliseconds(cfg.relay.statusIntervalMs));
    relay::PcmRelaySession session(sessionConfig, decider, *sink, stopRequested, &status);

    relay::RelayResult result;
    reporter.start();
    try {
        result = session.run(*source);
    } catch (const std::exception &e) {
        LOG_CRITICAL("[middle-server] relay aborted: {}", e.what());
        result.code = ErrorCode::INTERNAL_UNKNOWN;
    }
    reporter.stop();

    if (stopRequested.load(std::memory_order_relaxed)) {
        LOG_INFO("[middle-server] terminated by signal");
    }
    LOG_INFO("[middle-server] summary: {}", reporter.buildStatusJson().dump());
    logging::shutdown();
    return toExitStatus(result.code);
}
