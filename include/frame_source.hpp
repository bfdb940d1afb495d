/**
 * Frame Source - sequential video feed abstraction
 * Network MJPEG/RTSP endpoints and local capture devices
 */

#ifndef FRAME_SOURCE_HPP
#define FRAME_SOURCE_HPP

#include <opencv2/opencv.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include "errors.hpp"

namespace logowatch {

/**
 * Decoded frame; the image is not modified after capture
 */
struct Frame {
  cv::Mat image;
  uint64_t sequence;
  std::chrono::system_clock::time_point captured;

  Frame() : sequence(0) {}
};

class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual ErrorCode open(const std::string& locator) = 0;

  // Blocks for at most the source's read timeout
  virtual ErrorCode read(Frame& frame) = 0;

  // Idempotent
  virtual void close() = 0;

  virtual bool isOpen() const = 0;
};

struct SourceConfig {
  std::string locator = "0";
  int openTimeoutMs = 5000;
  int readTimeoutMs = 2000;

  SourceConfig() = default;
};

// Device index when the locator is all digits
bool isDeviceIndex(const std::string& locator);

/**
 * cv::VideoCapture backed source
 */
class VideoCaptureSource : public FrameSource {
public:
  explicit VideoCaptureSource(const SourceConfig& config = SourceConfig());
  ~VideoCaptureSource() override;

  ErrorCode open(const std::string& locator) override;
  ErrorCode read(Frame& frame) override;
  void close() override;
  bool isOpen() const override;

private:
  SourceConfig config_;
  cv::VideoCapture capture_;
  std::string locator_;
  uint64_t nextSequence_;
};

} // namespace logowatch

#endif // FRAME_SOURCE_HPP
