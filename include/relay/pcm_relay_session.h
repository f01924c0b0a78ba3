#pragma once

#include "audio/audio_info.h"
#include "core/error_codes.h"
#include "delay/delay_decider.h"
#include "relay/pcm_endpoints.h"
#include "relay/session_status.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace middle_server {
namespace relay {

struct RelaySessionConfig {
    AudioInfo audio{};
    std::size_t chunkFrames{4800};
    // Wait applied before the chunk sent while the decider is Enabled.
    // Zero means "one chunk of playback time".
    std::chrono::milliseconds compensation{0};
    bool realtimePacing{false};
};

struct RelayResult {
    ErrorCode code{ErrorCode::OK};
    std::uint64_t chunksSent{0};
    std::uint64_t bytesSent{0};
    std::uint64_t compensationsApplied{0};
    delay::DelaySnapshot finalState{};
};

// Streams PCM from a source to a sink for one client session. Every chunk
// consults the shared DelayDecider before it is sent and advances it after.
class PcmRelaySession {
   public:
    using WaitFunction = std::function<void(std::chrono::microseconds)>;

    PcmRelaySession(RelaySessionConfig config, delay::DelayDeciderPtr decider, PcmChunkSink &sink,
                    std::atomic_bool &stopFlag, SessionStatus *status = nullptr);

    // Replaces the sleep used for compensation and pacing (tests).
    void setWaitFunction(WaitFunction wait);

    RelayResult run(PcmSource &source);

    const delay::DelayDeciderPtr &decider() const {
        return decider_;
    }

   private:
    // Fills @p buf with up to one chunk. Returns bytes read or -1 on source error.
    ssize_t readChunk(PcmSource &source, std::uint8_t *buf, std::size_t chunkBytes);
    std::chrono::microseconds compensationFor(std::size_t chunkBytes) const;
    // Closes the sink and records the outcome. Every exit of run() goes through here.
    RelayResult finish(RelayResult result, const char *reason);

    RelaySessionConfig config_;
    delay::DelayDeciderPtr decider_;
    PcmChunkSink &sink_;
    std::atomic_bool &stopFlag_;
    SessionStatus *status_{nullptr};
    WaitFunction wait_;
};

}  // namespace relay
}  // namespace middle_server
