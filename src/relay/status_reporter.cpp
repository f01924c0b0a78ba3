#include "relay/status_reporter.h"

#include "logging/logger.h"

#include <string>
#include <utility>

namespace middle_server {
namespace relay {

StatusReporter::StatusReporter(const SessionStatus &status, delay::DelayDeciderPtr decider,
                               std::chrono::milliseconds interval, Publisher publisher)
    : status_(status),
      decider_(std::move(decider)),
      interval_(interval),
      publisher_(std::move(publisher)) {
    if (!publisher_) {
        publisher_ = [](const nlohmann::json &payload) {
            LOG_INFO("[StatusReporter] {}", payload.dump());
        };
    }
}

StatusReporter::~StatusReporter() {
    stop();
}

nlohmann::json StatusReporter::buildStatusJson() const {
    nlohmann::json payload = toJson(status_.snapshot());
    payload["event"] = "status";
    if (decider_) {
        const auto state = decider_->snapshot();
        payload["delay"]["classification"] = std::string(delay::toString(state.classification));
        payload["delay"]["send_count"] = state.sendCount;
        payload["delay"]["threshold"] = state.threshold;
    }
    payload["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count();
    return payload;
}

void StatusReporter::start() {
    if (interval_.count() <= 0) {
        return;
    }
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { publisherLoop(); });
}

void StatusReporter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wakeCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StatusReporter::publisherLoop() {
    while (running_.load()) {
        try {
            publisher_(buildStatusJson());
        } catch (const std::exception &e) {
            LOG_WARN("[StatusReporter] publish failed: {}", e.what());
        }
        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}

}  // namespace relay
}  // namespace middle_server
