#include "relay/pcm_relay_session.h"

#include "logging/logger.h"

#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace middle_server {
namespace relay {

namespace {

void sleepFor(std::chrono::microseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

}  // namespace

PcmRelaySession::PcmRelaySession(RelaySessionConfig config, delay::DelayDeciderPtr decider,
                                 PcmChunkSink &sink, std::atomic_bool &stopFlag,
                                 SessionStatus *status)
    : config_(std::move(config)),
      decider_(std::move(decider)),
      sink_(sink),
      stopFlag_(stopFlag),
      status_(status),
      wait_(sleepFor) {
    if (!decider_) {
        throw std::invalid_argument("PcmRelaySession requires a DelayDecider");
    }
}

void PcmRelaySession::setWaitFunction(WaitFunction wait) {
    wait_ = wait ? std::move(wait) : WaitFunction(sleepFor);
}

ssize_t PcmRelaySession::readChunk(PcmSource &source, std::uint8_t *buf, std::size_t chunkBytes) {
    std::size_t offset = 0;
    while (offset < chunkBytes) {
        ssize_t n = source.read(buf + offset, chunkBytes - offset);
        if (n < 0) {
            return -1;
        }
        if (n == 0) {
            break;
        }
        offset += static_cast<std::size_t>(n);
    }
    return static_cast<ssize_t>(offset);
}

std::chrono::microseconds PcmRelaySession::compensationFor(std::size_t chunkBytes) const {
    if (config_.compensation.count() > 0) {
        return std::chrono::duration_cast<std::chrono::microseconds>(config_.compensation);
    }
    return chunkDuration(config_.audio, chunkBytes);
}

RelayResult PcmRelaySession::finish(RelayResult result, const char *reason) {
    sink_.close();
    result.finalState = decider_->snapshot();
    if (status_) {
        if (reason && *reason) {
            status_->setDisconnectReason(reason);
        }
        status_->setStreaming(false);
    }

    if (result.code == ErrorCode::OK || result.code == ErrorCode::RELAY_STOPPED) {
        LOG_INFO("[PcmRelaySession] session ended ({}): chunks={} bytes={} compensations={} "
                 "delay={}",
                 errorCodeToString(result.code), result.chunksSent, result.bytesSent,
                 result.compensationsApplied, delay::toString(result.finalState.classification));
    } else {
        LOG_ERROR("[PcmRelaySession] session failed ({} {}): chunks={} bytes={}",
                  errorCodeToHex(result.code), errorCodeToString(result.code), result.chunksSent,
                  result.bytesSent);
    }
    return result;
}

RelayResult PcmRelaySession::run(PcmSource &source) {
    RelayResult result;

    auto validation = validateAudioInfo(config_.audio);
    if (!validation.ok) {
        LOG_ERROR("[PcmRelaySession] audio info invalid: {}", validation.reason);
        result.code = ErrorCode::RELAY_INVALID_AUDIO_INFO;
        return finish(result, "invalid_audio_info");
    }

    const std::size_t frameBytes = config_.audio.bytesPerFrame();
    const std::size_t chunkBytes = config_.chunkFrames * frameBytes;
    if (chunkBytes == 0 || chunkBytes / frameBytes != config_.chunkFrames) {
        LOG_ERROR("[PcmRelaySession] invalid chunk size: {} frames of {} bytes",
                  config_.chunkFrames, frameBytes);
        result.code = ErrorCode::CONFIG_INVALID_VALUE;
        return finish(result, "invalid_chunk_size");
    }

    if (status_) {
        status_->clearDisconnectReason();
    }

    const std::string announcement = formatAudioInfo(config_.audio);
    if (!sink_.sendText(announcement)) {
        result.code = ErrorCode::RELAY_SINK_WRITE_FAILED;
        return finish(result, "sink_error");
    }
    if (status_) {
        status_->setAudioInfo(config_.audio);
        status_->setStreaming(true);
    }

    LOG_INFO("[PcmRelaySession] audio info sent: \"{}\"", announcement);
    LOG_INFO("  - chunk:           {} frames ({} bytes, {} us)", config_.chunkFrames, chunkBytes,
             chunkDuration(config_.audio, chunkBytes).count());
    LOG_INFO("  - delay threshold: {}", decider_->threshold());
    LOG_INFO("  - realtime pacing: {}", config_.realtimePacing ? "on" : "off");

    std::vector<std::uint8_t> buf(chunkBytes);
    const char *reason = "";
    auto previous = decider_->currentClassification();

    while (true) {
        if (stopFlag_.load(std::memory_order_relaxed)) {
            LOG_INFO("[PcmRelaySession] stop requested");
            result.code = ErrorCode::RELAY_STOPPED;
            reason = "stopped";
            break;
        }

        const ssize_t n = readChunk(source, buf.data(), chunkBytes);
        if (n < 0) {
            result.code = ErrorCode::RELAY_SOURCE_READ_FAILED;
            reason = "source_error";
            break;
        }

        const std::size_t bytesRead = static_cast<std::size_t>(n);
        const std::size_t bytes = bytesRead - bytesRead % frameBytes;
        if (bytes != bytesRead) {
            LOG_WARN("[PcmRelaySession] dropping {} trailing bytes (partial frame)",
                     bytesRead - bytes);
        }
        if (bytes == 0) {
            LOG_DEBUG("[PcmRelaySession] end of source");
            break;
        }

        const auto classification = decider_->currentClassification();
        if (delay::shouldApplyDelay(classification)) {
            const auto wait = compensationFor(bytes);
            LOG_INFO("[PcmRelaySession] delay compensation: waiting {} us before chunk #{}",
                     wait.count(), result.chunksSent + 1);
            wait_(wait);
            ++result.compensationsApplied;
            if (status_) {
                status_->recordCompensation(static_cast<std::uint64_t>(wait.count()));
            }
        }

        if (!sink_.sendChunk(buf.data(), bytes)) {
            result.code = ErrorCode::RELAY_SINK_WRITE_FAILED;
            reason = "sink_error";
            break;
        }

        const auto committed = decider_->recordSend();
        ++result.chunksSent;
        result.bytesSent += bytes;
        if (status_) {
            status_->recordChunk(bytes, committed.classification);
        }
        if (committed.classification != previous) {
            LOG_INFO("[PcmRelaySession] delay {} -> {} at send #{} (threshold {})",
                     delay::toString(previous), delay::toString(committed.classification),
                     committed.sendCount, committed.threshold);
            previous = committed.classification;
        }
        LOG_EVERY_N(TRACE, 100, "[PcmRelaySession] sent chunk #{} ({} bytes)",
                    committed.sendCount, bytes);

        if (config_.realtimePacing) {
            wait_(chunkDuration(config_.audio, bytes));
        }

        if (bytesRead < chunkBytes) {
            LOG_DEBUG("[PcmRelaySession] end of source");
            break;
        }
    }

    return finish(result, reason);
}

}  // namespace relay
}  // namespace middle_server
