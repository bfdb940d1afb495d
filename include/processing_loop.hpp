/**
 * Processing Loop - capture, match, annotate and publish driver
 * Owns the frame source and is the only writer of the shared state
 */

#ifndef PROCESSING_LOOP_HPP
#define PROCESSING_LOOP_HPP

#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "annotator.hpp"
#include "errors.hpp"
#include "feature_detector.hpp"
#include "frame_source.hpp"
#include "matcher.hpp"
#include "reference_set.hpp"
#include "shared_state.hpp"

namespace logowatch {

enum class LoopState {
  Starting,
  Running,
  Recovering,
  Stopped
};

const char* stateName(LoopState state);

/**
 * Configuration for the processing loop
 */
struct LoopConfig {
  std::string locator = "0";
  int processEvery = 1;                     // full cycle every N frames
  cv::Size frameSize = cv::Size(320, 240);  // processing size, 0x0 keeps input
  int maxReadFailures = 3;                  // consecutive, before Stopped
  double fpsSmoothing = 0.1;                // EMA weight of the newest sample
  std::string countPolicy = "latest";       // latest | cumulative
  bool requireReferences = false;
  bool enableProfiling = false;

  // Loaded during Starting, in order
  std::vector<std::pair<std::string, std::string>> initialReferences;

  DetectorConfig detector;
  AnnotatorConfig annotator;

  LoopConfig() = default;
};

class ProcessingLoop {
public:
  using StateListener = std::function<void(LoopState, ErrorCode)>;

  ProcessingLoop(const LoopConfig& config,
                 std::unique_ptr<FrameSource> source,
                 std::shared_ptr<ReferenceSet> references,
                 std::shared_ptr<SharedState> shared);
  ~ProcessingLoop();

  ProcessingLoop(const ProcessingLoop&) = delete;
  ProcessingLoop& operator=(const ProcessingLoop&) = delete;

  // Must be installed before start(); called on the thread that changes state
  void setStateListener(StateListener listener);

  // Opens the source and loads initial references, then spawns the loop
  ErrorCode start();

  // Cooperative; returns once the loop thread has released the source
  void stop();

  bool waitUntilStopped(std::chrono::milliseconds timeout);

  LoopState state() const;
  ErrorCode lastError() const;

  static bool shouldProcess(uint64_t frameIndex, int processEvery) {
    return processEvery <= 1 || frameIndex % static_cast<uint64_t>(processEvery) == 0;
  }

  // Running total for the cumulative count policy, saturates instead of wrapping
  static int64_t addCount(int64_t total, int count) {
    if (count <= 0) {
      return total;
    }
    if (total > std::numeric_limits<int64_t>::max() - count) {
      return std::numeric_limits<int64_t>::max();
    }
    return total + count;
  }

private:
  LoopConfig config_;

  // Components
  std::unique_ptr<FrameSource> source_;
  std::shared_ptr<ReferenceSet> references_;
  std::shared_ptr<SharedState> shared_;
  Matcher matcher_;
  Annotator annotator_;

  // Thread and state
  std::thread thread_;
  std::atomic<bool> stopRequested_;
  mutable std::mutex stateMutex_;
  std::condition_variable stateChanged_;
  LoopState state_;
  ErrorCode lastError_;
  StateListener listener_;

  // Owned by the loop thread
  Statistics stats_;
  std::vector<std::pair<std::string, int64_t>> cumulative_;
  std::shared_ptr<const EncodedImage> lastEncoded_;
  std::chrono::steady_clock::time_point lastFrameTime_;
  bool haveFrameTime_;

  void run();
  void loop();
  bool recover(ErrorCode error, int& consecutiveFailures);
  void processFrame(const Frame& frame, uint64_t frameIndex);
  void updateFps(std::chrono::steady_clock::time_point now);
  void updateCounts(const FrameMatches& matches);
  void publish();
  void setState(LoopState state, ErrorCode error,
                const std::string& detail = std::string());
};

} // namespace logowatch

#endif // PROCESSING_LOOP_HPP
