/**
 * Matcher - per-slot good match counting between a frame and the references
 */

#ifndef MATCHER_HPP
#define MATCHER_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "feature_detector.hpp"
#include "reference_set.hpp"

namespace logowatch {

/**
 * Match result for a single reference slot
 */
struct MatchResult {
  std::string slot;
  int goodMatches;
  bool detected;
  std::vector<cv::DMatch> matches;  // query = reference, train = frame
  TemplatePtr reference;            // template the matches index into

  MatchResult() : goodMatches(0), detected(false) {}
};

/**
 * Everything the annotator needs about one processed frame
 */
struct FrameMatches {
  std::vector<cv::KeyPoint> frameKeypoints;
  std::vector<MatchResult> results;  // slot order of the snapshot

  const MatchResult* find(const std::string& slot) const;
  int count(const std::string& slot) const;
};

class Matcher {
public:
  explicit Matcher(const DetectorConfig& config = DetectorConfig());
  ~Matcher();

  DetectorConfig getConfig() const { return config_; }

  FrameMatches match(const cv::Mat& frame, const ReferenceSnapshot& snapshot);

  // Lowe's ratio test, strict so that d1 == ratio * d2 is rejected
  static bool passesRatioTest(float nearest, float secondNearest, float ratio) {
    return nearest < ratio * secondNearest;
  }

  struct MatchStats {
    int frameKeypoints = 0;
    double detectionTimeMs = 0.0;
    double matchingTimeMs = 0.0;
  };

  MatchStats getLastStats() const { return lastStats_; }

private:
  DetectorConfig config_;
  FeatureDetector detector_;
  cv::Ptr<cv::BFMatcher> matcher_;
  MatchStats lastStats_;

  MatchResult matchReference(const SlotEntry& entry,
                             const std::vector<cv::KeyPoint>& frameKeypoints,
                             const cv::Mat& frameDescriptors);

  int countGeometricInliers(const ReferenceTemplate& reference,
                            const std::vector<cv::KeyPoint>& frameKeypoints,
                            std::vector<cv::DMatch>& goodMatches) const;
};

} // namespace logowatch

#endif // MATCHER_HPP
