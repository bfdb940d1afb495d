/**
 * Reference Set Implementation
 */

#include "reference_set.hpp"
#include <iostream>

namespace logowatch {

cv::Mat decodeImage(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) {
    return cv::Mat();
  }
  try {
    return cv::imdecode(bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    std::cerr << "[References] imdecode failed: " << e.what() << std::endl;
    return cv::Mat();
  }
}

cv::Mat readImage(const std::string& path) {
  if (path.empty()) {
    return cv::Mat();
  }
  try {
    return cv::imread(path, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    std::cerr << "[References] imread failed for " << path << ": "
              << e.what() << std::endl;
    return cv::Mat();
  }
}

ReferenceSet::ReferenceSet(const std::vector<std::string>& slots,
                           const DetectorConfig& detectorConfig)
  : detector_(detectorConfig), generation_(0) {
  for (const auto& name : slots) {
    if (indexOf(name) < 0) {
      slots_.push_back({name, nullptr});
    }
  }
}

ReferenceSet::~ReferenceSet() = default;

int ReferenceSet::indexOf(const std::string& slot) const {
  for (size_t i = 0; i < slots_.size(); ++i) {
    if (slots_[i].slot == slot) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

ErrorCode ReferenceSet::load(const std::string& slot, const cv::Mat& image) {
  // Slot names are fixed at construction, lookup needs no lock
  int index = indexOf(slot);
  if (index < 0) {
    std::cerr << "[References] Unknown slot '" << slot << "'" << std::endl;
    return ErrorCode::UnknownSlot;
  }

  if (image.empty()) {
    std::cerr << "[References] Empty image for slot " << slot << std::endl;
    return ErrorCode::InvalidImage;
  }

  std::lock_guard<std::mutex> loadLock(loadMutex_);

  auto reference = std::make_shared<ReferenceTemplate>();
  reference->slot = slot;
  reference->image = image.clone();

  if (!detector_.detectAndCompute(reference->image,
                                  reference->keypoints,
                                  reference->descriptors)) {
    std::cerr << "[References] No features in image for slot " << slot
              << " (" << image.cols << "x" << image.rows << ")" << std::endl;
    return ErrorCode::FeatureExtractionFailed;
  }

  reference->generation = ++generation_;

  std::cout << "[References] Slot " << slot << " loaded: "
            << reference->keypoints.size() << " keypoints, "
            << reference->image.cols << "x" << reference->image.rows
            << " (generation " << reference->generation << ")" << std::endl;

  {
    std::lock_guard<std::mutex> swapLock(swapMutex_);
    slots_[index].reference = std::move(reference);
  }

  return ErrorCode::None;
}

ErrorCode ReferenceSet::loadFile(const std::string& slot,
                                 const std::string& path) {
  if (indexOf(slot) < 0) {
    return ErrorCode::UnknownSlot;
  }
  cv::Mat image = readImage(path);
  if (image.empty()) {
    std::cerr << "[References] Could not read image '" << path
              << "' for slot " << slot << std::endl;
    return ErrorCode::InvalidImage;
  }
  return load(slot, image);
}

ErrorCode ReferenceSet::loadBytes(const std::string& slot,
                                  const std::vector<uint8_t>& bytes) {
  if (indexOf(slot) < 0) {
    return ErrorCode::UnknownSlot;
  }
  cv::Mat image = decodeImage(bytes);
  if (image.empty()) {
    std::cerr << "[References] Could not decode " << bytes.size()
              << " bytes for slot " << slot << std::endl;
    return ErrorCode::InvalidImage;
  }
  return load(slot, image);
}

ReferenceSnapshot ReferenceSet::snapshot() const {
  std::lock_guard<std::mutex> lock(swapMutex_);
  return slots_;
}

TemplatePtr ReferenceSet::get(const std::string& slot) const {
  int index = indexOf(slot);
  if (index < 0) {
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(swapMutex_);
  return slots_[index].reference;
}

std::vector<std::string> ReferenceSet::slotNames() const {
  std::vector<std::string> names;
  names.reserve(slots_.size());
  for (const auto& entry : slots_) {
    names.push_back(entry.slot);
  }
  return names;
}

bool ReferenceSet::hasSlot(const std::string& slot) const {
  return indexOf(slot) >= 0;
}

int ReferenceSet::populatedCount() const {
  std::lock_guard<std::mutex> lock(swapMutex_);
  int count = 0;
  for (const auto& entry : slots_) {
    if (entry.reference) {
      ++count;
    }
  }
  return count;
}

} // namespace logowatch
