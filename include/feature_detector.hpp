/**
 * Feature Detector - scale/rotation invariant keypoint extraction
 * Wraps an OpenCV Feature2D (SIFT by default, ORB or BRISK on request)
 */

#ifndef FEATURE_DETECTOR_HPP
#define FEATURE_DETECTOR_HPP

#include <opencv2/opencv.hpp>
#include <opencv2/features2d.hpp>
#include <string>
#include <vector>

namespace logowatch {

/**
 * Feature detector and matching configuration
 */
struct DetectorConfig {
  std::string type = "sift";        // sift | orb | brisk
  int maxFeatures = 0;              // 0 keeps every detected keypoint
  float matchRatioThreshold = 0.67f; // Lowe's ratio test
  int minGoodMatches = 20;          // detection threshold per slot
  bool verifyGeometry = false;      // RANSAC homography on good matches
  float ransacThreshold = 3.0f;
  int ransacIterations = 2000;

  DetectorConfig() = default;
};

bool isSupportedDetector(const std::string& type);

/**
 * Keypoint/descriptor extractor
 * One instance per thread; the underlying Feature2D is not shared.
 */
class FeatureDetector {
public:
  explicit FeatureDetector(const DetectorConfig& config = DetectorConfig());
  ~FeatureDetector();

  DetectorConfig getConfig() const { return config_; }

  // Distance norm matching this detector's descriptors
  int normType() const { return normType_; }

  // Returns false when the image is empty or yields no descriptors
  bool detectAndCompute(const cv::Mat& image,
                        std::vector<cv::KeyPoint>& keypoints,
                        cv::Mat& descriptors);

  struct DetectionStats {
    int keypointsDetected = 0;
    double detectionTimeMs = 0.0;
  };

  DetectionStats getLastStats() const { return lastStats_; }

private:
  DetectorConfig config_;
  cv::Ptr<cv::Feature2D> detector_;
  int normType_;
  DetectionStats lastStats_;

  void limitFeatures(std::vector<cv::KeyPoint>& keypoints,
                     cv::Mat& descriptors) const;
};

} // namespace logowatch

#endif // FEATURE_DETECTOR_HPP
