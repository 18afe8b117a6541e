// Scripted DetectionClient for queue tests.

#ifndef LIVE_CHUNKER_TESTS_FAKE_DETECTION_CLIENT_HPP
#define LIVE_CHUNKER_TESTS_FAKE_DETECTION_CLIENT_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "live_chunker/detection_client.hpp"

namespace live_chunker::testing {

class FakeDetectionClient : public DetectionClient {
 public:
  // Decides the outcome of one call; throw to fail the attempt.
  using Behavior = std::function<DetectionResult(const ChunkDescriptor&, int call)>;

  FakeDetectionClient() {
    behavior_ = [](const ChunkDescriptor&, int) {
      DetectionResult r;
      r.detection_count = 1;
      return r;
    };
  }

  void set_behavior(Behavior behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    behavior_ = std::move(behavior);
  }

  void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

  DetectionResult process(const ChunkDescriptor& chunk) override {
    Behavior behavior;
    int call = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(chunk.id);
      call = static_cast<int>(calls_.size());
      behavior = behavior_;
    }
    if (delay_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
    return behavior(chunk, call);
  }

  // Chunk ids in call order, one entry per attempt.
  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  int call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(calls_.size());
  }

 private:
  mutable std::mutex mutex_;
  Behavior behavior_;
  std::vector<std::string> calls_;
  std::atomic<long long> delay_ms_{0};
};

}  // namespace live_chunker::testing

#endif  // LIVE_CHUNKER_TESTS_FAKE_DETECTION_CLIENT_HPP
