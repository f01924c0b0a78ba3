#include "audio/audio_info.h"

#include "audio/pcm_format_set.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace middle_server {

namespace {

bool parseUnsigned(const std::string& text, unsigned long max, unsigned long& out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || value > max) {
        return false;
    }
    out = value;
    return true;
}

}  // namespace

AudioInfoValidationResult validateAudioInfo(const AudioInfo& info) {
    if (!PcmFormatSet::isAllowedChannels(info.channels)) {
        return {false, "channels unsupported"};
    }
    if (!PcmFormatSet::isAllowedSampleRate(info.sampleRate)) {
        return {false, "sample_rate unsupported"};
    }
    const uint16_t requiredBits = PcmFormatSet::requiredBitsPerSample(info.pcmFormat);
    if (requiredBits == 0) {
        return {false, "unsupported pcm format"};
    }
    if (info.bitsPerSample != requiredBits) {
        return {false, "bits_per_sample does not match pcm format"};
    }
    return {true, ""};
}

std::string formatAudioInfo(const AudioInfo& info) {
    return std::to_string(info.channels) + " " + std::to_string(info.sampleRate) + " " +
           std::to_string(info.bitsPerSample) + " " + info.pcmFormat;
}

std::optional<AudioInfo> parseAudioInfo(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> parts;
    std::string token;
    while (iss >> token) {
        parts.push_back(token);
    }
    if (parts.size() != 4) {
        return std::nullopt;
    }

    unsigned long channels = 0;
    unsigned long rate = 0;
    unsigned long bits = 0;
    if (!parseUnsigned(parts[0], 0xFFFF, channels) || !parseUnsigned(parts[1], 0xFFFFFFFF, rate) ||
        !parseUnsigned(parts[2], 0xFFFF, bits)) {
        return std::nullopt;
    }

    AudioInfo info;
    info.channels = static_cast<uint16_t>(channels);
    info.sampleRate = static_cast<uint32_t>(rate);
    info.bitsPerSample = static_cast<uint16_t>(bits);
    info.pcmFormat = parts[3];
    return info;
}

std::chrono::microseconds chunkDuration(const AudioInfo& info, std::size_t bytes) {
    const std::size_t frameBytes = info.bytesPerFrame();
    if (frameBytes == 0 || info.sampleRate == 0) {
        return std::chrono::microseconds{0};
    }
    const auto frames = static_cast<std::uint64_t>(bytes / frameBytes);
    return std::chrono::microseconds(
        static_cast<std::chrono::microseconds::rep>(frames * 1000000ULL / info.sampleRate));
}

}  // namespace middle_server
