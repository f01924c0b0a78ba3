#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace middle_server {

// Description of a relayed PCM stream. Announced to the client as one text
// line "<channels> <sample_rate> <bits_per_sample> <pcm_format>" before any
// PCM payload.
struct AudioInfo {
    uint16_t channels{2};
    uint32_t sampleRate{48000};
    uint16_t bitsPerSample{16};
    std::string pcmFormat{"s16le"};

    std::size_t bytesPerFrame() const {
        return static_cast<std::size_t>(channels) * (bitsPerSample / 8);
    }
};

struct AudioInfoValidationResult {
    bool ok{false};
    std::string reason;
};

AudioInfoValidationResult validateAudioInfo(const AudioInfo& info);

std::string formatAudioInfo(const AudioInfo& info);

// Parses an announcement line. Returns nullopt for a wrong field count or
// non-numeric fields; does not validate the values.
std::optional<AudioInfo> parseAudioInfo(const std::string& line);

// Playback duration of @p bytes of PCM. Partial frames are ignored.
std::chrono::microseconds chunkDuration(const AudioInfo& info, std::size_t bytes);

}  // namespace middle_server
