#pragma once

#include "delay/delay_decider.h"
#include "relay/session_status.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

namespace middle_server {
namespace relay {

// Periodically publishes a JSON status of one relay session from its own
// thread. Reads the DelayDecider concurrently with the streaming loop.
class StatusReporter {
   public:
    using Publisher = std::function<void(const nlohmann::json &)>;

    // Default publisher logs the payload at info level.
    StatusReporter(const SessionStatus &status, delay::DelayDeciderPtr decider,
                   std::chrono::milliseconds interval, Publisher publisher = nullptr);
    ~StatusReporter();

    StatusReporter(const StatusReporter &) = delete;
    StatusReporter &operator=(const StatusReporter &) = delete;

    // No-op when the interval is not positive or already running.
    void start();
    void stop();

    bool running() const {
        return running_.load();
    }

    nlohmann::json buildStatusJson() const;

   private:
    void publisherLoop();

    const SessionStatus &status_;
    delay::DelayDeciderPtr decider_;
    std::chrono::milliseconds interval_;
    Publisher publisher_;

    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::thread thread_;
};

}  // namespace relay
}  // namespace middle_server
