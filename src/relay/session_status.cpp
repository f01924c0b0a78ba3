#include "relay/session_status.h"

namespace middle_server {
namespace relay {

void SessionStatus::setStreaming(bool streaming) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.streaming = streaming;
}

void SessionStatus::setAudioInfo(const AudioInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.audioInfoSent = true;
    status_.audio = info;
}

void SessionStatus::recordChunk(std::size_t bytes, delay::DelayClassification classification) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++status_.chunksSent;
    status_.bytesSent += bytes;
    status_.lastClassification = classification;
}

void SessionStatus::recordCompensation(std::uint64_t micros) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++status_.compensationsApplied;
    status_.compensationMicros += micros;
}

void SessionStatus::setDisconnectReason(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.disconnectReason = reason;
}

void SessionStatus::clearDisconnectReason() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.disconnectReason.clear();
}

SessionSnapshot SessionStatus::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

nlohmann::json toJson(const SessionSnapshot& snapshot) {
    nlohmann::json j;
    j["streaming"] = snapshot.streaming;
    j["chunks_sent"] = snapshot.chunksSent;
    j["bytes_sent"] = snapshot.bytesSent;
    j["delay"] = {
        {"classification", std::string(delay::toString(snapshot.lastClassification))},
        {"compensations_applied", snapshot.compensationsApplied},
        {"compensation_us", snapshot.compensationMicros},
    };
    if (snapshot.audioInfoSent) {
        j["audio"] = {
            {"channels", snapshot.audio.channels},
            {"sample_rate", snapshot.audio.sampleRate},
            {"bits_per_sample", snapshot.audio.bitsPerSample},
            {"pcm_format", snapshot.audio.pcmFormat},
        };
    } else {
        j["audio"] = nullptr;
    }
    if (!snapshot.disconnectReason.empty()) {
        j["disconnect_reason"] = snapshot.disconnectReason;
    }
    return j;
}

}  // namespace relay
}  // namespace middle_server
