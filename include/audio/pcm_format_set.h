/*
 * PCM format constraints for relayed streams.
 * Single source of truth for the sample rates / channel counts / sample
 * formats the browser client can play back.
 */
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace middle_server {
namespace PcmFormatSet {

namespace detail {

template <typename T, std::size_t N>
constexpr bool contains(const std::array<T, N>& arr, T value) {
    for (auto v : arr) {
        if (v == value) {
            return true;
        }
    }
    return false;
}

}  // namespace detail

// Sample format names as announced to the client
constexpr std::string_view kFormatS16le = "s16le";
constexpr std::string_view kFormatF32le = "f32le";

constexpr uint16_t kMinChannels = 1;
constexpr uint16_t kMaxChannels = 8;

constexpr std::array<uint32_t, 3> kRates44k = {44100, 88200, 176400};
constexpr std::array<uint32_t, 5> kRates48k = {16000, 24000, 48000, 96000, 192000};

constexpr bool isAllowedChannels(uint16_t channels) {
    return channels >= kMinChannels && channels <= kMaxChannels;
}

constexpr bool isAllowedSampleRate(uint32_t rate) {
    return detail::contains(kRates44k, rate) || detail::contains(kRates48k, rate);
}

// Bits per sample a format name requires, 0 for unknown formats.
constexpr uint16_t requiredBitsPerSample(std::string_view format) {
    if (format == kFormatS16le) {
        return 16;
    }
    if (format == kFormatF32le) {
        return 32;
    }
    return 0;
}

inline std::string allowedSampleRatesString() {
    std::string result;
    for (auto rate : kRates44k) {
        result += std::to_string(rate) + ", ";
    }
    for (std::size_t i = 0; i < kRates48k.size(); ++i) {
        result += std::to_string(kRates48k[i]);
        if (i + 1 < kRates48k.size()) {
            result += ", ";
        }
    }
    return result;
}

}  // namespace PcmFormatSet
}  // namespace middle_server
