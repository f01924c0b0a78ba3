#pragma once

#include "delay/delay_classification.h"

#include <cstdint>
#include <memory>
#include <shared_mutex>

namespace middle_server {
namespace delay {

struct DelaySnapshot {
    std::uint64_t sendCount{0};
    std::uint64_t threshold{0};
    DelayClassification classification{DelayClassification::Initialized};
};

/**
 * @brief Per-session delay decision state.
 *
 * One instance per streaming session, shared between the thread that sends
 * PCM chunks (recordSend) and any number of readers deciding whether to delay
 * a chunk. The send counter and the classification are updated together
 * under the exclusive lock; readers take the shared lock and always see a
 * pair that satisfies classify(sendCount, threshold).
 */
class DelayDecider {
   public:
    /**
     * @brief Create a shared decider for a new session.
     *
     * @param threshold Number of sends at which compensation is enabled.
     * @throws ConfigError (CONFIG_INVALID_DELAY_THRESHOLD) if threshold < 0
     */
    static std::shared_ptr<DelayDecider> create(std::int64_t threshold);

    explicit DelayDecider(std::uint64_t threshold);

    DelayDecider(const DelayDecider&) = delete;
    DelayDecider& operator=(const DelayDecider&) = delete;

    // Record one transmitted PCM chunk. Returns the state committed by this call.
    DelaySnapshot recordSend();

    DelayClassification currentClassification() const;

    DelaySnapshot snapshot() const;

    std::uint64_t threshold() const {
        return threshold_;
    }

   private:
    const std::uint64_t threshold_;

    mutable std::shared_mutex mutex_;
    std::uint64_t sendCount_{0};
    DelayClassification classification_{DelayClassification::Initialized};
};

using DelayDeciderPtr = std::shared_ptr<DelayDecider>;

}  // namespace delay
}  // namespace middle_server
