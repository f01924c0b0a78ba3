#pragma once

#include <cstdint>
#include <string_view>

namespace middle_server {
namespace delay {

// Delay regime of one relay session. Only ever moves forward:
// Initialized -> Enabled -> Disabled.
enum class DelayClassification : std::uint8_t {
    // PCM sending has started but the threshold has not been reached yet.
    Initialized = 0,
    // The send count equals the configured threshold; compensation applies.
    Enabled = 1,
    // The send count is past the threshold; compensation no longer applies.
    Disabled = 2,
};

/**
 * @brief Classification for a given send count and threshold.
 *
 * Total and pure. A zero threshold behaves like a threshold of one, so the
 * first send is Enabled and the second Disabled.
 */
constexpr DelayClassification classify(std::uint64_t sendCount, std::uint64_t threshold) {
    if (sendCount == 0) {
        return DelayClassification::Initialized;
    }
    const std::uint64_t effective = threshold == 0 ? 1 : threshold;
    if (sendCount < effective) {
        return DelayClassification::Initialized;
    }
    if (sendCount == effective) {
        return DelayClassification::Enabled;
    }
    return DelayClassification::Disabled;
}

constexpr bool shouldApplyDelay(DelayClassification classification) {
    return classification == DelayClassification::Enabled;
}

std::string_view toString(DelayClassification classification);

}  // namespace delay
}  // namespace middle_server
