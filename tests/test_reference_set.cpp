#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "matcher.hpp"
#include "reference_set.hpp"
#include "test_support.hpp"

using namespace logowatch;
using namespace logowatch::fixtures;

namespace {

std::vector<std::string> twoSlots() {
  return {"logo1", "logo2"};
}

} // namespace

TEST(ReferenceSetTest, StartsEmpty) {
  ReferenceSet references(twoSlots());
  EXPECT_EQ(references.populatedCount(), 0);
  EXPECT_EQ(references.get("logo1"), nullptr);

  ReferenceSnapshot snapshot = references.snapshot();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0].slot, "logo1");
  EXPECT_EQ(snapshot[1].slot, "logo2");
  EXPECT_EQ(snapshot[0].reference, nullptr);
}

TEST(ReferenceSetTest, DuplicateSlotNamesCollapse) {
  ReferenceSet references({"logo1", "logo1", "logo2"});
  EXPECT_EQ(references.slotNames(), twoSlots());
}

TEST(ReferenceSetTest, LoadPopulatesSlot) {
  ReferenceSet references(twoSlots());
  ASSERT_EQ(references.load("logo1", makeTexturedImage(1)), ErrorCode::None);

  TemplatePtr reference = references.get("logo1");
  ASSERT_NE(reference, nullptr);
  EXPECT_EQ(reference->slot, "logo1");
  EXPECT_FALSE(reference->keypoints.empty());
  EXPECT_EQ(reference->descriptors.rows, static_cast<int>(reference->keypoints.size()));
  EXPECT_EQ(reference->generation, 1u);
  EXPECT_EQ(references.populatedCount(), 1);
}

TEST(ReferenceSetTest, EncodedBytesLoad) {
  ReferenceSet references(twoSlots());
  EXPECT_EQ(references.loadBytes("logo2", encodePng(makeTexturedImage(2))), ErrorCode::None);
  ASSERT_NE(references.get("logo2"), nullptr);
  EXPECT_EQ(references.get("logo2")->image.size(), cv::Size(320, 240));
}

TEST(ReferenceSetTest, UndecodableBytesKeepPreviousTemplate) {
  ReferenceSet references(twoSlots());
  ASSERT_EQ(references.load("logo1", makeTexturedImage(3)), ErrorCode::None);
  TemplatePtr before = references.get("logo1");

  std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
  EXPECT_EQ(references.loadBytes("logo1", garbage), ErrorCode::InvalidImage);
  EXPECT_EQ(references.loadBytes("logo1", {}), ErrorCode::InvalidImage);

  TemplatePtr after = references.get("logo1");
  EXPECT_EQ(after, before);
  EXPECT_EQ(after->generation, before->generation);
}

TEST(ReferenceSetTest, FeaturelessImageIsRejected) {
  ReferenceSet references(twoSlots());
  ASSERT_EQ(references.load("logo1", makeTexturedImage(4)), ErrorCode::None);
  TemplatePtr before = references.get("logo1");

  EXPECT_EQ(references.load("logo1", makeBlankImage()), ErrorCode::FeatureExtractionFailed);
  EXPECT_EQ(references.get("logo1"), before);
}

TEST(ReferenceSetTest, MissingFileIsInvalidImage) {
  ReferenceSet references(twoSlots());
  EXPECT_EQ(references.loadFile("logo1", "/nonexistent/logo.jpg"), ErrorCode::InvalidImage);
  EXPECT_EQ(references.loadFile("logo1", ""), ErrorCode::InvalidImage);
  EXPECT_EQ(references.get("logo1"), nullptr);
}

TEST(ReferenceSetTest, UnknownSlotIsRejected) {
  ReferenceSet references(twoSlots());
  EXPECT_FALSE(references.hasSlot("logo3"));
  EXPECT_EQ(references.load("logo3", makeTexturedImage(5)), ErrorCode::UnknownSlot);
  EXPECT_EQ(references.loadBytes("logo3", encodePng(makeTexturedImage(5))), ErrorCode::UnknownSlot);
  EXPECT_EQ(references.loadFile("logo3", "whatever.jpg"), ErrorCode::UnknownSlot);
  EXPECT_EQ(references.populatedCount(), 0);
}

TEST(ReferenceSetTest, TakenSnapshotSurvivesReload) {
  ReferenceSet references(twoSlots());
  ASSERT_EQ(references.load("logo1", makeTexturedImage(6)), ErrorCode::None);

  ReferenceSnapshot snapshot = references.snapshot();
  TemplatePtr held = snapshot[0].reference;
  size_t keypoints = held->keypoints.size();

  ASSERT_EQ(references.load("logo1", makeTexturedImage(7)), ErrorCode::None);

  EXPECT_EQ(snapshot[0].reference, held);
  EXPECT_EQ(held->keypoints.size(), keypoints);
  EXPECT_NE(references.get("logo1"), held);
  EXPECT_GT(references.get("logo1")->generation, held->generation);
}

TEST(ReferenceSetTest, ConcurrentReloadsNeverExposeMixedTemplates) {
  auto references = std::make_shared<ReferenceSet>(twoSlots());
  cv::Mat imageA = makeTexturedImage(31);
  cv::Mat imageB = makeTexturedImage(47);
  ASSERT_EQ(references->load("logo1", imageA), ErrorCode::None);

  std::atomic<bool> done{false};
  std::atomic<int> inconsistent{0};
  std::atomic<int> observed{0};

  std::thread reader([&] {
    Matcher matcher;
    uint64_t lastGeneration = 0;
    while (!done) {
      ReferenceSnapshot snapshot = references->snapshot();
      const TemplatePtr& reference = snapshot[0].reference;
      if (!reference ||
          reference->descriptors.rows != static_cast<int>(reference->keypoints.size()) ||
          reference->generation < lastGeneration) {
        ++inconsistent;
      }
      if (reference) {
        lastGeneration = reference->generation;
        FrameMatches result = matcher.match(imageA, snapshot);
        for (const auto& m : result.find("logo1")->matches) {
          if (m.queryIdx < 0 || m.queryIdx >= static_cast<int>(reference->keypoints.size())) {
            ++inconsistent;
          }
        }
      }
      ++observed;
    }
  });

  std::thread writerA([&] {
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(references->load("logo1", imageA), ErrorCode::None);
    }
  });
  std::thread writerB([&] {
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(references->load("logo1", imageB), ErrorCode::None);
    }
  });

  writerA.join();
  writerB.join();
  done = true;
  reader.join();

  EXPECT_EQ(inconsistent.load(), 0);
  EXPECT_GT(observed.load(), 0);
  EXPECT_EQ(references->get("logo1")->generation, 11u);
}
