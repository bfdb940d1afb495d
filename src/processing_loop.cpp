/**
 * Processing Loop Implementation
 */

#include "processing_loop.hpp"
#include <iostream>
#include "process_memory.hpp"

namespace logowatch {

namespace {

// Releases the capture handle whichever way the loop thread exits
class SourceGuard {
public:
  explicit SourceGuard(FrameSource& source) : source_(source) {}
  ~SourceGuard() { source_.close(); }

  SourceGuard(const SourceGuard&) = delete;
  SourceGuard& operator=(const SourceGuard&) = delete;

private:
  FrameSource& source_;
};

double epochSeconds(std::chrono::system_clock::time_point when) {
  return std::chrono::duration<double>(when.time_since_epoch()).count();
}

} // namespace

const char* stateName(LoopState state) {
  switch (state) {
    case LoopState::Starting:   return "Starting";
    case LoopState::Running:    return "Running";
    case LoopState::Recovering: return "Recovering";
    case LoopState::Stopped:    return "Stopped";
  }
  return "Unknown";
}

ProcessingLoop::ProcessingLoop(const LoopConfig& config,
                               std::unique_ptr<FrameSource> source,
                               std::shared_ptr<ReferenceSet> references,
                               std::shared_ptr<SharedState> shared)
  : config_(config),
    source_(std::move(source)),
    references_(std::move(references)),
    shared_(std::move(shared)),
    matcher_(config.detector),
    annotator_(config.annotator),
    stopRequested_(false),
    state_(LoopState::Starting),
    lastError_(ErrorCode::None),
    haveFrameTime_(false) {

  for (const auto& slot : references_->slotNames()) {
    stats_.matches.emplace_back(slot, 0);
    cumulative_.emplace_back(slot, 0);
  }
}

ProcessingLoop::~ProcessingLoop() {
  stop();
}

void ProcessingLoop::setStateListener(StateListener listener) {
  listener_ = std::move(listener);
}

ErrorCode ProcessingLoop::start() {
  if (thread_.joinable()) {
    return ErrorCode::None;
  }

  setState(LoopState::Starting, ErrorCode::None);

  ErrorCode openError = source_->open(config_.locator);
  if (openError != ErrorCode::None) {
    std::cerr << "[Loop] Cannot open capture source " << config_.locator
              << ": " << errorName(openError) << std::endl;
    setState(LoopState::Stopped, openError, "open failed");
    return openError;
  }

  for (const auto& reference : config_.initialReferences) {
    ErrorCode loadError = references_->loadFile(reference.first, reference.second);
    if (loadError == ErrorCode::None) {
      continue;
    }
    std::cerr << "[Loop] Reference " << reference.first << " from "
              << reference.second << " failed: " << errorName(loadError)
              << std::endl;
    if (config_.requireReferences) {
      source_->close();
      setState(LoopState::Stopped, loadError,
               "required reference " + reference.first);
      return loadError;
    }
  }

  std::cout << "[Loop] Starting with " << references_->populatedCount() << "/"
            << references_->slotNames().size() << " references, processing every "
            << config_.processEvery << " frame(s)" << std::endl;

  stopRequested_ = false;
  thread_ = std::thread(&ProcessingLoop::run, this);
  return ErrorCode::None;
}

void ProcessingLoop::stop() {
  stopRequested_ = true;
  if (thread_.joinable()) {
    thread_.join();
  } else {
    source_->close();
  }
}

bool ProcessingLoop::waitUntilStopped(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(stateMutex_);
  return stateChanged_.wait_for(lock, timeout, [this] {
    return state_ == LoopState::Stopped;
  });
}

LoopState ProcessingLoop::state() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return state_;
}

ErrorCode ProcessingLoop::lastError() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return lastError_;
}

void ProcessingLoop::run() {
  SourceGuard guard(*source_);

  try {
    setState(LoopState::Running, ErrorCode::None);
    loop();
  } catch (const std::exception& e) {
    std::cerr << "[Loop] Processing aborted: " << e.what() << std::endl;
    setState(LoopState::Stopped, ErrorCode::ProcessingFailed, e.what());
    return;
  }

  if (state() != LoopState::Stopped) {
    setState(LoopState::Stopped, lastError(), "stop requested");
  }
}

void ProcessingLoop::loop() {
  uint64_t frameIndex = 0;
  int consecutiveFailures = 0;

  while (!stopRequested_) {
    Frame frame;
    ErrorCode readError = source_->read(frame);

    if (readError != ErrorCode::None) {
      if (stopRequested_) {
        break;
      }
      if (!recover(readError, consecutiveFailures)) {
        return;
      }
      continue;
    }

    consecutiveFailures = 0;
    processFrame(frame, frameIndex++);
  }
}

bool ProcessingLoop::recover(ErrorCode error, int& consecutiveFailures) {
  ++consecutiveFailures;
  setState(LoopState::Recovering, error);

  std::cerr << "[Loop] Read failed (" << errorName(error) << "), attempt "
            << consecutiveFailures << "/" << config_.maxReadFailures << std::endl;

  if (consecutiveFailures >= config_.maxReadFailures) {
    std::cerr << "[Loop] Giving up on " << config_.locator << std::endl;
    setState(LoopState::Stopped, error, "too many consecutive read failures");
    return false;
  }

  source_->close();
  ErrorCode reopenError = source_->open(config_.locator);
  if (reopenError != ErrorCode::None) {
    std::cerr << "[Loop] Reconnect to " << config_.locator << " failed" << std::endl;
    setState(LoopState::Stopped, reopenError, "reconnect failed");
    return false;
  }

  setState(LoopState::Running, error);
  return true;
}

void ProcessingLoop::processFrame(const Frame& frame, uint64_t frameIndex) {
  updateFps(std::chrono::steady_clock::now());
  ++stats_.framesCaptured;

  cv::Mat working = frame.image;
  if (config_.frameSize.area() > 0 && working.size() != config_.frameSize) {
    cv::resize(frame.image, working, config_.frameSize);
  }

  if (shouldProcess(frameIndex, config_.processEvery)) {
    ReferenceSnapshot snapshot = references_->snapshot();
    FrameMatches matches = matcher_.match(working, snapshot);
    ++stats_.framesProcessed;
    updateCounts(matches);

    EncodedImage encoded;
    ErrorCode encodeError = annotator_.annotate(working, matches, encoded);
    if (encodeError != ErrorCode::None) {
      ++stats_.encodeFailures;
      std::cerr << "[Loop] Frame " << frame.sequence
                << " not published: " << errorName(encodeError) << std::endl;
      return;
    }
    lastEncoded_ = std::make_shared<EncodedImage>(std::move(encoded));

    if (config_.enableProfiling && stats_.framesProcessed % 30 == 0) {
      Matcher::MatchStats timing = matcher_.getLastStats();
      std::cout << "[Loop] Frame " << frame.sequence << ": "
                << timing.frameKeypoints << " keypoints, detect "
                << timing.detectionTimeMs << "ms, match "
                << timing.matchingTimeMs << "ms, fps " << stats_.fps;
      for (const auto& result : matches.results) {
        std::cout << ", " << result.slot << "=" << result.goodMatches
                  << (result.detected ? "*" : "");
      }
      std::cout << std::endl;
    }
  } else if (!lastEncoded_) {
    // Nothing annotated yet to echo
    return;
  }

  publish();
}

void ProcessingLoop::updateFps(std::chrono::steady_clock::time_point now) {
  if (haveFrameTime_) {
    double elapsed = std::chrono::duration<double>(now - lastFrameTime_).count();
    if (elapsed > 0.0) {
      double instant = 1.0 / elapsed;
      stats_.fps = stats_.fps <= 0.0
                 ? instant
                 : config_.fpsSmoothing * instant +
                   (1.0 - config_.fpsSmoothing) * stats_.fps;
    }
  }
  lastFrameTime_ = now;
  haveFrameTime_ = true;
}

void ProcessingLoop::updateCounts(const FrameMatches& matches) {
  bool cumulative = config_.countPolicy == "cumulative";

  for (size_t i = 0; i < stats_.matches.size(); ++i) {
    const std::string& slot = stats_.matches[i].first;
    int count = matches.count(slot);
    if (cumulative) {
      cumulative_[i].second = addCount(cumulative_[i].second, count);
      stats_.matches[i].second = cumulative_[i].second;
    } else {
      stats_.matches[i].second = count;
    }
  }
}

void ProcessingLoop::publish() {
  ++stats_.framesPublished;
  stats_.lastUpdate = epochSeconds(std::chrono::system_clock::now());
  stats_.hasMemory = residentMemoryMb(stats_.memoryMb);
  shared_->publish(lastEncoded_, stats_);
}

void ProcessingLoop::setState(LoopState state, ErrorCode error,
                              const std::string& detail) {
  LoopState previous;
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    previous = state_;
    state_ = state;
    lastError_ = error;
  }
  shared_->setStatus(stateName(state), error, detail);
  stateChanged_.notify_all();

  if (previous != state) {
    std::cout << "[Loop] " << stateName(previous) << " -> " << stateName(state);
    if (error != ErrorCode::None) {
      std::cout << " (" << errorName(error) << ")";
    }
    std::cout << std::endl;
  }

  if (listener_) {
    listener_(state, error);
  }
}

} // namespace logowatch
