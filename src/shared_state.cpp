/**
 * Shared State Implementation
 *
 * Each publish builds an immutable PublishedState off-lock and swaps the
 * pointer in; readers copy the pointer under the same short lock.
 */

#include "shared_state.hpp"

namespace logowatch {

int64_t Statistics::matchCount(const std::string& slot) const {
  for (const auto& entry : matches) {
    if (entry.first == slot) {
      return entry.second;
    }
  }
  return 0;
}

SharedState::SharedState() = default;

void SharedState::publish(EncodedImage encoded, const Statistics& stats) {
  publish(std::shared_ptr<const EncodedImage>(
            std::make_shared<EncodedImage>(std::move(encoded))), stats);
}

void SharedState::publish(std::shared_ptr<const EncodedImage> encoded,
                          const Statistics& stats) {
  auto next = std::make_shared<PublishedState>();
  next->frame = std::move(encoded);
  next->stats = stats;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    next->sequence = latest_ ? latest_->sequence + 1 : 1;
    latest_ = std::move(next);
  }
  updated_.notify_all();
}

std::shared_ptr<const PublishedState> SharedState::read() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::shared_ptr<const EncodedImage> SharedState::readFrame() const {
  auto current = read();
  return current ? current->frame : nullptr;
}

Statistics SharedState::readStats() const {
  auto current = read();
  return current ? current->stats : Statistics();
}

uint64_t SharedState::sequence() const {
  auto current = read();
  return current ? current->sequence : 0;
}

std::shared_ptr<const PublishedState> SharedState::waitForUpdate(
    uint64_t lastSequence, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  bool fresh = updated_.wait_for(lock, timeout, [&] {
    return latest_ && latest_->sequence > lastSequence;
  });
  return fresh ? latest_ : nullptr;
}

void SharedState::notifyAll() const {
  updated_.notify_all();
}

void SharedState::setStatus(const std::string& state, ErrorCode lastError,
                            const std::string& detail) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_.state = state;
  status_.lastError = lastError;
  status_.detail = detail;
}

LoopStatus SharedState::readStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

} // namespace logowatch
