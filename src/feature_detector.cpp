/**
 * Feature Detector Implementation
 */

#include "feature_detector.hpp"
#include <chrono>
#include <algorithm>
#include <numeric>
#include <iostream>

namespace logowatch {

bool isSupportedDetector(const std::string& type) {
  return type == "sift" || type == "orb" || type == "brisk";
}

FeatureDetector::FeatureDetector(const DetectorConfig& config)
  : config_(config), normType_(cv::NORM_L2) {

  if (config_.type == "orb") {
    // ORB needs an explicit budget, 500 is its own default
    int budget = config_.maxFeatures > 0 ? config_.maxFeatures : 500;
    detector_ = cv::ORB::create(budget);
    normType_ = cv::NORM_HAMMING;
  } else if (config_.type == "brisk") {
    detector_ = cv::BRISK::create(30, 3, 1.0f);
    normType_ = cv::NORM_HAMMING;
  } else {
    if (config_.type != "sift") {
      std::cerr << "[Detector] Unknown detector '" << config_.type
                << "', falling back to SIFT" << std::endl;
      config_.type = "sift";
    }
    detector_ = cv::SIFT::create(std::max(config_.maxFeatures, 0));
    normType_ = cv::NORM_L2;
  }
}

FeatureDetector::~FeatureDetector() = default;

bool FeatureDetector::detectAndCompute(
    const cv::Mat& image,
    std::vector<cv::KeyPoint>& keypoints,
    cv::Mat& descriptors) {

  auto start = std::chrono::high_resolution_clock::now();

  keypoints.clear();
  descriptors.release();
  lastStats_ = DetectionStats();

  if (image.empty()) {
    return false;
  }

  try {
    cv::Mat gray;
    if (image.channels() == 4) {
      cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else if (image.channels() == 3) {
      cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
      gray = image;
    }

    detector_->detectAndCompute(gray, cv::noArray(), keypoints, descriptors);
    limitFeatures(keypoints, descriptors);
  } catch (const cv::Exception& e) {
    std::cerr << "[Detector] detectAndCompute failed: " << e.what() << std::endl;
    keypoints.clear();
    descriptors.release();
    return false;
  }

  auto end = std::chrono::high_resolution_clock::now();
  lastStats_.detectionTimeMs =
    std::chrono::duration<double, std::milli>(end - start).count();
  lastStats_.keypointsDetected = static_cast<int>(keypoints.size());

  return !descriptors.empty();
}

void FeatureDetector::limitFeatures(std::vector<cv::KeyPoint>& keypoints,
                                    cv::Mat& descriptors) const {
  int limit = config_.maxFeatures;
  if (limit <= 0 || static_cast<int>(keypoints.size()) <= limit) {
    return;
  }

  // Keep the strongest responses, descriptor rows follow their keypoints
  std::vector<int> order(keypoints.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&keypoints](int a, int b) {
                     return keypoints[a].response > keypoints[b].response;
                   });
  order.resize(limit);

  std::vector<cv::KeyPoint> keptKeypoints;
  keptKeypoints.reserve(limit);
  cv::Mat keptDescriptors(limit, descriptors.cols, descriptors.type());
  for (int i = 0; i < limit; ++i) {
    keptKeypoints.push_back(keypoints[order[i]]);
    descriptors.row(order[i]).copyTo(keptDescriptors.row(i));
  }

  keypoints.swap(keptKeypoints);
  descriptors = keptDescriptors;
}

} // namespace logowatch
