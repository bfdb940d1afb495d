/**
 * Shared State - latest annotated frame and statistics
 * Single writer (processing loop), any number of readers
 */

#ifndef SHARED_STATE_HPP
#define SHARED_STATE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "errors.hpp"

namespace logowatch {

struct Statistics {
  double fps;
  std::vector<std::pair<std::string, int64_t>> matches;  // slot order
  double lastUpdate;                                 // epoch seconds
  bool hasMemory;
  double memoryMb;
  uint64_t framesCaptured;
  uint64_t framesProcessed;
  uint64_t framesPublished;
  uint64_t encodeFailures;

  Statistics()
    : fps(0.0), lastUpdate(0.0), hasMemory(false), memoryMb(0.0),
      framesCaptured(0), framesProcessed(0), framesPublished(0),
      encodeFailures(0) {}

  int64_t matchCount(const std::string& slot) const;
};

using EncodedImage = std::vector<unsigned char>;

/**
 * One publish: frame and statistics always travel together
 */
struct PublishedState {
  std::shared_ptr<const EncodedImage> frame;
  Statistics stats;
  uint64_t sequence = 0;
};

struct LoopStatus {
  std::string state = "Starting";
  ErrorCode lastError = ErrorCode::None;
  std::string detail;
};

class SharedState {
public:
  SharedState();

  SharedState(const SharedState&) = delete;
  SharedState& operator=(const SharedState&) = delete;

  void publish(EncodedImage encoded, const Statistics& stats);
  void publish(std::shared_ptr<const EncodedImage> encoded,
               const Statistics& stats);

  // Null until the first publish
  std::shared_ptr<const PublishedState> read() const;
  std::shared_ptr<const EncodedImage> readFrame() const;
  Statistics readStats() const;
  uint64_t sequence() const;

  // Blocks the calling reader only; null on timeout
  std::shared_ptr<const PublishedState> waitForUpdate(
    uint64_t lastSequence, std::chrono::milliseconds timeout) const;

  // Wakes every waiting reader, used on shutdown
  void notifyAll() const;

  void setStatus(const std::string& state, ErrorCode lastError,
                 const std::string& detail = std::string());
  LoopStatus readStatus() const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable updated_;
  std::shared_ptr<const PublishedState> latest_;
  LoopStatus status_;
};

} // namespace logowatch

#endif // SHARED_STATE_HPP
