#include "delay/delay_decider.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <mutex>
#include <string>

namespace middle_server {
namespace delay {

std::shared_ptr<DelayDecider> DelayDecider::create(std::int64_t threshold) {
    if (threshold < 0) {
        LOG_ERROR("[DelayDecider] rejected negative delay threshold {}", threshold);
        throw ConfigError(ErrorCode::CONFIG_INVALID_DELAY_THRESHOLD,
                          "delay threshold must be >= 0 (got " + std::to_string(threshold) + ")");
    }
    return std::make_shared<DelayDecider>(static_cast<std::uint64_t>(threshold));
}

DelayDecider::DelayDecider(std::uint64_t threshold) : threshold_(threshold) {}

DelaySnapshot DelayDecider::recordSend() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ++sendCount_;
    classification_ = classify(sendCount_, threshold_);
    return DelaySnapshot{sendCount_, threshold_, classification_};
}

DelayClassification DelayDecider::currentClassification() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return classification_;
}

DelaySnapshot DelayDecider::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return DelaySnapshot{sendCount_, threshold_, classification_};
}

}  // namespace delay
}  // namespace middle_server
