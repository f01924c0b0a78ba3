#pragma once

#include "audio/audio_info.h"
#include "delay/delay_classification.h"

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace middle_server {
namespace relay {

struct SessionSnapshot {
    bool streaming{false};
    bool audioInfoSent{false};
    AudioInfo audio{};
    std::uint64_t chunksSent{0};
    std::uint64_t bytesSent{0};
    std::uint64_t compensationsApplied{0};
    std::uint64_t compensationMicros{0};
    delay::DelayClassification lastClassification{delay::DelayClassification::Initialized};
    std::string disconnectReason;
};

// Aggregates relay session progress for observers (status logger, tests).
class SessionStatus {
   public:
    void setStreaming(bool streaming);
    void setAudioInfo(const AudioInfo& info);
    void recordChunk(std::size_t bytes, delay::DelayClassification classification);
    void recordCompensation(std::uint64_t micros);
    void setDisconnectReason(const std::string& reason);
    void clearDisconnectReason();

    SessionSnapshot snapshot() const;

   private:
    mutable std::mutex mutex_;
    SessionSnapshot status_;
};

nlohmann::json toJson(const SessionSnapshot& snapshot);

}  // namespace relay
}  // namespace middle_server
