/**
 * Frame Source Implementation
 */

#include "frame_source.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace logowatch {

bool isDeviceIndex(const std::string& locator) {
  return !locator.empty() &&
         std::all_of(locator.begin(), locator.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

VideoCaptureSource::VideoCaptureSource(const SourceConfig& config)
  : config_(config), nextSequence_(0) {}

VideoCaptureSource::~VideoCaptureSource() {
  close();
}

ErrorCode VideoCaptureSource::open(const std::string& locator) {
  close();

  std::vector<int> params = {
    cv::CAP_PROP_OPEN_TIMEOUT_MSEC, config_.openTimeoutMs,
    cv::CAP_PROP_READ_TIMEOUT_MSEC, config_.readTimeoutMs
  };

  bool opened = false;
  try {
    if (isDeviceIndex(locator)) {
      opened = capture_.open(std::stoi(locator), cv::CAP_ANY, params);
    } else {
      opened = capture_.open(locator, cv::CAP_ANY, params);
    }
  } catch (const std::exception& e) {
    // cv::Exception, or std::out_of_range from an oversized device index
    std::cerr << "[Source] Open threw for " << locator << ": "
              << e.what() << std::endl;
    opened = false;
  }

  if (!opened || !capture_.isOpened()) {
    std::cerr << "[Source] Failed to open " << locator << std::endl;
    capture_.release();
    return ErrorCode::SourceUnavailable;
  }

  locator_ = locator;
  std::cout << "[Source] Opened " << locator << " ("
            << capture_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
            << capture_.get(cv::CAP_PROP_FRAME_HEIGHT) << ", backend "
            << capture_.getBackendName() << ")" << std::endl;
  return ErrorCode::None;
}

ErrorCode VideoCaptureSource::read(Frame& frame) {
  if (!capture_.isOpened()) {
    return ErrorCode::EndOfStream;
  }

  auto start = std::chrono::steady_clock::now();
  cv::Mat image;
  bool ok = false;
  try {
    ok = capture_.read(image);
  } catch (const cv::Exception& e) {
    std::cerr << "[Source] Read threw: " << e.what() << std::endl;
    ok = false;
  }

  if (!ok || image.empty()) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
    return elapsed >= config_.readTimeoutMs ? ErrorCode::ReadTimeout
                                            : ErrorCode::EndOfStream;
  }

  frame.image = image;
  frame.sequence = nextSequence_++;
  frame.captured = std::chrono::system_clock::now();
  return ErrorCode::None;
}

void VideoCaptureSource::close() {
  if (capture_.isOpened()) {
    capture_.release();
    std::cout << "[Source] Released " << locator_ << std::endl;
  }
}

bool VideoCaptureSource::isOpen() const {
  return capture_.isOpened();
}

} // namespace logowatch
