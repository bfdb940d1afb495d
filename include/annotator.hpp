/**
 * Annotator - renders per-slot match panels and encodes them for streaming
 */

#ifndef ANNOTATOR_HPP
#define ANNOTATOR_HPP

#include <opencv2/opencv.hpp>
#include <vector>
#include "errors.hpp"
#include "matcher.hpp"

namespace logowatch {

struct AnnotatorConfig {
  cv::Size viewSize = cv::Size(320, 240);  // size of each slot panel
  int jpegQuality = 90;

  AnnotatorConfig() = default;
};

ErrorCode encodeJpeg(const cv::Mat& image, int quality,
                     std::vector<uchar>& encoded);

/**
 * Stateless; the input frame is only read
 */
class Annotator {
public:
  explicit Annotator(const AnnotatorConfig& config = AnnotatorConfig());

  AnnotatorConfig getConfig() const { return config_; }

  // Side-by-side panels, one per slot, with the count overlay
  cv::Mat render(const cv::Mat& frame, const FrameMatches& matches) const;

  ErrorCode annotate(const cv::Mat& frame, const FrameMatches& matches,
                     std::vector<uchar>& encoded) const;

private:
  AnnotatorConfig config_;

  cv::Mat renderPanel(const cv::Mat& frame,
                      const std::vector<cv::KeyPoint>& frameKeypoints,
                      const MatchResult& result) const;
};

} // namespace logowatch

#endif // ANNOTATOR_HPP
