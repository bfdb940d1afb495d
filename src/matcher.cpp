/**
 * Matcher Implementation
 */

#include "matcher.hpp"
#include <chrono>
#include <cmath>
#include <iostream>

namespace logowatch {

namespace {

bool validateHomography(const cv::Mat& H, const cv::Size& referenceSize) {
  if (H.empty() || H.rows != 3 || H.cols != 3) {
    return false;
  }

  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      double val = H.at<double>(i, j);
      if (std::isnan(val) || std::isinf(val)) {
        return false;
      }
    }
  }

  if (std::abs(cv::determinant(H)) < 1e-6) {
    return false;
  }

  // Projected reference outline must stay a convex quadrilateral
  std::vector<cv::Point2f> corners = {
    cv::Point2f(0, 0),
    cv::Point2f(static_cast<float>(referenceSize.width), 0),
    cv::Point2f(static_cast<float>(referenceSize.width),
                static_cast<float>(referenceSize.height)),
    cv::Point2f(0, static_cast<float>(referenceSize.height))
  };
  std::vector<cv::Point2f> projected;
  cv::perspectiveTransform(corners, projected, H);

  auto cross2d = [](const cv::Point2f& o, const cv::Point2f& a, const cv::Point2f& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
  };

  int positive = 0;
  int negative = 0;
  for (size_t i = 0; i < 4; ++i) {
    float c = cross2d(projected[i], projected[(i + 1) % 4], projected[(i + 2) % 4]);
    if (c > 0) {
      ++positive;
    } else if (c < 0) {
      ++negative;
    }
  }
  return positive == 4 || negative == 4;
}

} // namespace

const MatchResult* FrameMatches::find(const std::string& slot) const {
  for (const auto& result : results) {
    if (result.slot == slot) {
      return &result;
    }
  }
  return nullptr;
}

int FrameMatches::count(const std::string& slot) const {
  const MatchResult* result = find(slot);
  return result ? result->goodMatches : 0;
}

Matcher::Matcher(const DetectorConfig& config)
  : config_(config), detector_(config) {
  matcher_ = cv::BFMatcher::create(detector_.normType(), false);
}

Matcher::~Matcher() = default;

FrameMatches Matcher::match(const cv::Mat& frame,
                            const ReferenceSnapshot& snapshot) {
  FrameMatches output;
  lastStats_ = MatchStats();

  cv::Mat frameDescriptors;
  detector_.detectAndCompute(frame, output.frameKeypoints, frameDescriptors);
  lastStats_.frameKeypoints = static_cast<int>(output.frameKeypoints.size());
  lastStats_.detectionTimeMs = detector_.getLastStats().detectionTimeMs;

  auto matchStart = std::chrono::high_resolution_clock::now();

  output.results.reserve(snapshot.size());
  for (const auto& entry : snapshot) {
    output.results.push_back(
      matchReference(entry, output.frameKeypoints, frameDescriptors));
  }

  auto matchEnd = std::chrono::high_resolution_clock::now();
  lastStats_.matchingTimeMs =
    std::chrono::duration<double, std::milli>(matchEnd - matchStart).count();

  return output;
}

MatchResult Matcher::matchReference(
    const SlotEntry& entry,
    const std::vector<cv::KeyPoint>& frameKeypoints,
    const cv::Mat& frameDescriptors) {

  MatchResult result;
  result.slot = entry.slot;
  result.reference = entry.reference;

  if (!entry.reference || entry.reference->descriptors.empty() ||
      frameDescriptors.empty()) {
    return result;
  }

  const ReferenceTemplate& reference = *entry.reference;
  if (reference.descriptors.type() != frameDescriptors.type() ||
      reference.descriptors.cols != frameDescriptors.cols) {
    std::cerr << "[Matcher] Descriptor layout mismatch for slot "
              << entry.slot << std::endl;
    return result;
  }

  std::vector<std::vector<cv::DMatch>> knnMatches;
  try {
    matcher_->knnMatch(reference.descriptors, frameDescriptors, knnMatches, 2);
  } catch (const cv::Exception& e) {
    std::cerr << "[Matcher] knnMatch failed for slot " << entry.slot
              << ": " << e.what() << std::endl;
    return result;
  }

  for (const auto& candidates : knnMatches) {
    if (candidates.size() < 2) {
      continue;
    }
    if (passesRatioTest(candidates[0].distance, candidates[1].distance,
                        config_.matchRatioThreshold)) {
      result.matches.push_back(candidates[0]);
    }
  }

  if (config_.verifyGeometry) {
    result.goodMatches = countGeometricInliers(reference, frameKeypoints,
                                               result.matches);
  } else {
    result.goodMatches = static_cast<int>(result.matches.size());
  }
  result.detected = result.goodMatches >= config_.minGoodMatches;

  return result;
}

int Matcher::countGeometricInliers(
    const ReferenceTemplate& reference,
    const std::vector<cv::KeyPoint>& frameKeypoints,
    std::vector<cv::DMatch>& goodMatches) const {

  if (goodMatches.size() < 4) {
    goodMatches.clear();
    return 0;
  }

  std::vector<cv::Point2f> srcPoints, dstPoints;
  srcPoints.reserve(goodMatches.size());
  dstPoints.reserve(goodMatches.size());
  for (const auto& m : goodMatches) {
    srcPoints.push_back(reference.keypoints[m.queryIdx].pt);
    dstPoints.push_back(frameKeypoints[m.trainIdx].pt);
  }

  std::vector<uchar> inlierMask;
  cv::Mat H;
  try {
    H = cv::findHomography(srcPoints, dstPoints, cv::RANSAC,
                           config_.ransacThreshold, inlierMask,
                           config_.ransacIterations);
  } catch (const cv::Exception& e) {
    std::cerr << "[Matcher] findHomography failed: " << e.what() << std::endl;
    goodMatches.clear();
    return 0;
  }

  if (!validateHomography(H, reference.image.size())) {
    goodMatches.clear();
    return 0;
  }

  std::vector<cv::DMatch> inliers;
  for (size_t i = 0; i < goodMatches.size() && i < inlierMask.size(); ++i) {
    if (inlierMask[i]) {
      inliers.push_back(goodMatches[i]);
    }
  }
  goodMatches.swap(inliers);
  return static_cast<int>(goodMatches.size());
}

} // namespace logowatch
