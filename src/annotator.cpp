/**
 * Annotator Implementation
 */

#include "annotator.hpp"
#include <iostream>
#include <string>

namespace logowatch {

ErrorCode encodeJpeg(const cv::Mat& image, int quality,
                     std::vector<uchar>& encoded) {
  encoded.clear();
  if (image.empty()) {
    return ErrorCode::EncodingFailed;
  }

  std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
  try {
    if (!cv::imencode(".jpg", image, encoded, params) || encoded.empty()) {
      encoded.clear();
      return ErrorCode::EncodingFailed;
    }
  } catch (const cv::Exception& e) {
    std::cerr << "[Annotator] imencode failed: " << e.what() << std::endl;
    encoded.clear();
    return ErrorCode::EncodingFailed;
  }
  return ErrorCode::None;
}

Annotator::Annotator(const AnnotatorConfig& config)
  : config_(config) {}

cv::Mat Annotator::renderPanel(
    const cv::Mat& frame,
    const std::vector<cv::KeyPoint>& frameKeypoints,
    const MatchResult& result) const {

  cv::Mat panel;
  if (result.reference && !result.reference->image.empty()) {
    cv::drawMatches(result.reference->image, result.reference->keypoints,
                    frame, frameKeypoints, result.matches, panel,
                    cv::Scalar::all(-1), cv::Scalar::all(-1),
                    std::vector<char>(),
                    cv::DrawMatchesFlags::NOT_DRAW_SINGLE_POINTS);
  } else {
    panel = frame.clone();
  }

  cv::Mat resized;
  cv::resize(panel, resized, config_.viewSize);

  cv::Scalar color = result.detected ? cv::Scalar(0, 255, 0)
                                     : cv::Scalar(0, 165, 255);
  std::string label = result.slot + ": " + std::to_string(result.goodMatches);
  cv::putText(resized, label, cv::Point(10, 20),
              cv::FONT_HERSHEY_SIMPLEX, 0.6, color, 2);
  return resized;
}

cv::Mat Annotator::render(const cv::Mat& frame,
                          const FrameMatches& matches) const {
  if (frame.empty()) {
    return cv::Mat();
  }

  // Every panel is 8-bit BGR so hconcat and drawMatches accept them
  cv::Mat color;
  if (frame.channels() == 1) {
    cv::cvtColor(frame, color, cv::COLOR_GRAY2BGR);
  } else if (frame.channels() == 4) {
    cv::cvtColor(frame, color, cv::COLOR_BGRA2BGR);
  } else {
    color = frame;
  }

  if (matches.results.empty()) {
    cv::Mat resized;
    cv::resize(color, resized, config_.viewSize);
    return resized;
  }

  std::vector<cv::Mat> panels;
  panels.reserve(matches.results.size());
  for (const auto& result : matches.results) {
    panels.push_back(renderPanel(color, matches.frameKeypoints, result));
  }

  cv::Mat composite;
  cv::hconcat(panels, composite);
  return composite;
}

ErrorCode Annotator::annotate(const cv::Mat& frame,
                              const FrameMatches& matches,
                              std::vector<uchar>& encoded) const {
  cv::Mat composite;
  try {
    composite = render(frame, matches);
  } catch (const cv::Exception& e) {
    std::cerr << "[Annotator] Rendering failed: " << e.what() << std::endl;
    encoded.clear();
    return ErrorCode::EncodingFailed;
  }
  return encodeJpeg(composite, config_.jpegQuality, encoded);
}

} // namespace logowatch
