/**
 * Reference Set - active logo templates with hot replacement
 * Each slot holds an immutable template; reloads swap the whole object
 */

#ifndef REFERENCE_SET_HPP
#define REFERENCE_SET_HPP

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "errors.hpp"
#include "feature_detector.hpp"

namespace logowatch {

/**
 * Reference template: image plus the features extracted from it.
 * Never modified after construction.
 */
struct ReferenceTemplate {
  std::string slot;
  cv::Mat image;
  std::vector<cv::KeyPoint> keypoints;
  cv::Mat descriptors;
  uint64_t generation = 0;

  ReferenceTemplate() = default;
};

using TemplatePtr = std::shared_ptr<const ReferenceTemplate>;

/**
 * Consistent read-only view of every slot, taken once per processing cycle.
 * A slot that never loaded successfully carries a null template.
 */
struct SlotEntry {
  std::string slot;
  TemplatePtr reference;
};

using ReferenceSnapshot = std::vector<SlotEntry>;

// Decoding helpers; an empty result means the input was not an image
cv::Mat decodeImage(const std::vector<uint8_t>& bytes);
cv::Mat readImage(const std::string& path);

class ReferenceSet {
public:
  ReferenceSet(const std::vector<std::string>& slots,
               const DetectorConfig& detectorConfig = DetectorConfig());
  ~ReferenceSet();

  ReferenceSet(const ReferenceSet&) = delete;
  ReferenceSet& operator=(const ReferenceSet&) = delete;

  ErrorCode load(const std::string& slot, const cv::Mat& image);
  ErrorCode loadFile(const std::string& slot, const std::string& path);
  ErrorCode loadBytes(const std::string& slot,
                      const std::vector<uint8_t>& bytes);

  ReferenceSnapshot snapshot() const;
  TemplatePtr get(const std::string& slot) const;

  std::vector<std::string> slotNames() const;
  bool hasSlot(const std::string& slot) const;
  int populatedCount() const;

private:
  std::vector<SlotEntry> slots_;
  mutable std::mutex swapMutex_;   // guards slots_ pointers, held for copies only
  std::mutex loadMutex_;           // serializes extraction between reloads
  FeatureDetector detector_;
  uint64_t generation_;

  int indexOf(const std::string& slot) const;
};

} // namespace logowatch

#endif // REFERENCE_SET_HPP
