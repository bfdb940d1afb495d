#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <mutex>
#include "matcher.hpp"
#include "processing_loop.hpp"
#include "test_support.hpp"

using namespace logowatch;
using namespace logowatch::fixtures;

namespace {

class ProcessingLoopTest : public ::testing::Test {
protected:
  void SetUp() override {
    tracker_ = std::make_shared<SourceTracker>();
    references_ = std::make_shared<ReferenceSet>(
      std::vector<std::string>{"logo1", "logo2"}, config_.detector);
    shared_ = std::make_shared<SharedState>();
    frame_ = makeTexturedImage(77);
  }

  std::unique_ptr<ProcessingLoop> makeLoop(std::vector<ScriptedFrameSource::Step> steps,
                                           ErrorCode exhausted = ErrorCode::ReadTimeout,
                                           int maxSuccessfulOpens = -1) {
    auto source = std::make_unique<ScriptedFrameSource>(
      std::move(steps), tracker_, exhausted, maxSuccessfulOpens);
    return std::make_unique<ProcessingLoop>(config_, std::move(source),
                                            references_, shared_);
  }

  LoopConfig config_;
  std::shared_ptr<SourceTracker> tracker_;
  std::shared_ptr<ReferenceSet> references_;
  std::shared_ptr<SharedState> shared_;
  cv::Mat frame_;
};

const std::chrono::seconds kWait(20);

} // namespace

TEST(ProcessingLoopStatic, DecimationKeepsEveryNthFrame) {
  EXPECT_TRUE(ProcessingLoop::shouldProcess(0, 1));
  EXPECT_TRUE(ProcessingLoop::shouldProcess(7, 1));
  EXPECT_TRUE(ProcessingLoop::shouldProcess(0, 3));
  EXPECT_FALSE(ProcessingLoop::shouldProcess(1, 3));
  EXPECT_FALSE(ProcessingLoop::shouldProcess(2, 3));
  EXPECT_TRUE(ProcessingLoop::shouldProcess(3, 3));
  EXPECT_STREQ(stateName(LoopState::Recovering), "Recovering");
}

TEST(ProcessingLoopStatic, CumulativeTotalSaturates) {
  const int64_t max = std::numeric_limits<int64_t>::max();
  int64_t pastInt = static_cast<int64_t>(std::numeric_limits<int>::max()) - 10;

  EXPECT_EQ(ProcessingLoop::addCount(pastInt, 400),
            static_cast<int64_t>(std::numeric_limits<int>::max()) + 390);
  EXPECT_EQ(ProcessingLoop::addCount(max - 100, 400), max);
  EXPECT_EQ(ProcessingLoop::addCount(max, 1), max);
  EXPECT_EQ(ProcessingLoop::addCount(12, 0), 12);
}

TEST_F(ProcessingLoopTest, StopsAfterConsecutiveReadTimeouts) {
  config_.maxReadFailures = 3;
  auto loop = makeLoop(framesOf(frame_, 3), ErrorCode::ReadTimeout);

  std::mutex seenMutex;
  std::vector<LoopState> seen;
  loop->setStateListener([&](LoopState state, ErrorCode) {
    std::lock_guard<std::mutex> lock(seenMutex);
    seen.push_back(state);
  });

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  EXPECT_EQ(loop->state(), LoopState::Stopped);
  EXPECT_EQ(loop->lastError(), ErrorCode::ReadTimeout);

  Statistics stats = shared_->readStats();
  EXPECT_EQ(stats.framesCaptured, 3u);
  EXPECT_EQ(stats.framesPublished, 3u);
  EXPECT_NE(shared_->readFrame(), nullptr);

  LoopStatus status = shared_->readStatus();
  EXPECT_EQ(status.state, "Stopped");
  EXPECT_EQ(status.lastError, ErrorCode::ReadTimeout);

  loop->stop();
  EXPECT_FALSE(tracker_->open.load());
  EXPECT_EQ(tracker_->closes.load(), tracker_->opens.load());

  std::lock_guard<std::mutex> lock(seenMutex);
  auto running = std::find(seen.begin(), seen.end(), LoopState::Running);
  auto recovering = std::find(seen.begin(), seen.end(), LoopState::Recovering);
  ASSERT_NE(running, seen.end());
  ASSERT_NE(recovering, seen.end());
  EXPECT_LT(running - seen.begin(), recovering - seen.begin());
  EXPECT_EQ(seen.back(), LoopState::Stopped);
  EXPECT_EQ(std::count(seen.begin(), seen.end(), LoopState::Recovering), 3);
}

TEST_F(ProcessingLoopTest, SkippedFramesRepublishLastAnnotation) {
  config_.processEvery = 2;
  config_.maxReadFailures = 1;
  auto loop = makeLoop(framesOf(frame_, 10), ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  Statistics stats = shared_->readStats();
  EXPECT_EQ(stats.framesCaptured, 10u);
  EXPECT_EQ(stats.framesProcessed, 5u);
  EXPECT_EQ(stats.framesPublished, 10u);
  EXPECT_EQ(shared_->sequence(), 10u);
  EXPECT_EQ(loop->lastError(), ErrorCode::EndOfStream);
  EXPECT_GT(stats.lastUpdate, 0.0);
  EXPECT_GE(stats.fps, 0.0);
}

TEST_F(ProcessingLoopTest, PublishedCountsFollowReferences) {
  ASSERT_EQ(references_->load("logo1", frame_), ErrorCode::None);
  config_.maxReadFailures = 1;
  auto loop = makeLoop(framesOf(frame_, 2), ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  Statistics stats = shared_->readStats();
  ASSERT_EQ(stats.matches.size(), 2u);
  EXPECT_EQ(stats.matches[0].first, "logo1");
  EXPECT_EQ(stats.matches[1].first, "logo2");
  EXPECT_GE(stats.matchCount("logo1"), config_.detector.minGoodMatches);
  EXPECT_EQ(stats.matchCount("logo2"), 0);

  auto encoded = shared_->readFrame();
  ASSERT_NE(encoded, nullptr);
  cv::Mat decoded = cv::imdecode(*encoded, cv::IMREAD_COLOR);
  EXPECT_EQ(decoded.size(), cv::Size(640, 240));
}

TEST_F(ProcessingLoopTest, CumulativePolicyAccumulatesCounts) {
  ASSERT_EQ(references_->load("logo1", frame_), ErrorCode::None);
  int single = Matcher(config_.detector).match(frame_, references_->snapshot()).count("logo1");
  ASSERT_GT(single, 0);

  config_.countPolicy = "cumulative";
  config_.maxReadFailures = 1;
  auto loop = makeLoop(framesOf(frame_, 3), ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  EXPECT_EQ(shared_->readStats().matchCount("logo1"), 3 * single);
}

TEST_F(ProcessingLoopTest, StartFailsWhenSourceCannotOpen) {
  auto loop = makeLoop(framesOf(frame_, 1), ErrorCode::ReadTimeout, 0);

  EXPECT_EQ(loop->start(), ErrorCode::SourceUnavailable);
  EXPECT_EQ(loop->state(), LoopState::Stopped);
  EXPECT_EQ(loop->lastError(), ErrorCode::SourceUnavailable);
  EXPECT_EQ(shared_->readStatus().state, "Stopped");
  EXPECT_EQ(shared_->read(), nullptr);
  EXPECT_FALSE(tracker_->open.load());
}

TEST_F(ProcessingLoopTest, RequiredReferenceFailureAbortsStart) {
  config_.requireReferences = true;
  config_.initialReferences = {{"logo1", "/nonexistent/logo1.jpg"}};
  auto loop = makeLoop(framesOf(frame_, 1));

  EXPECT_EQ(loop->start(), ErrorCode::InvalidImage);
  EXPECT_EQ(loop->state(), LoopState::Stopped);
  EXPECT_EQ(tracker_->opens.load(), 1);
  EXPECT_EQ(tracker_->closes.load(), 1);
  EXPECT_FALSE(tracker_->open.load());
}

TEST_F(ProcessingLoopTest, OptionalReferenceFailureStillRuns) {
  config_.initialReferences = {{"logo1", "/nonexistent/logo1.jpg"}};
  config_.maxReadFailures = 1;
  auto loop = makeLoop(framesOf(frame_, 1), ErrorCode::EndOfStream);

  EXPECT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));
  EXPECT_EQ(shared_->readStats().framesPublished, 1u);
}

TEST_F(ProcessingLoopTest, FailedReconnectStops) {
  config_.maxReadFailures = 3;
  auto loop = makeLoop(framesOf(frame_, 2), ErrorCode::ReadTimeout, 1);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  EXPECT_EQ(loop->lastError(), ErrorCode::SourceUnavailable);
  EXPECT_EQ(tracker_->opens.load(), 2);
  EXPECT_EQ(shared_->readStats().framesPublished, 2u);
  loop->stop();
  EXPECT_FALSE(tracker_->open.load());
}

TEST_F(ProcessingLoopTest, RecoveredSourceResetsFailureCount) {
  config_.maxReadFailures = 2;
  std::vector<ScriptedFrameSource::Step> steps = {
    {ErrorCode::None, frame_},
    {ErrorCode::ReadTimeout, cv::Mat()},
    {ErrorCode::None, frame_},
    {ErrorCode::EndOfStream, cv::Mat()},
    {ErrorCode::None, frame_},
  };
  auto loop = makeLoop(steps, ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  EXPECT_EQ(shared_->readStats().framesCaptured, 3u);
  EXPECT_EQ(loop->lastError(), ErrorCode::EndOfStream);
}

TEST_F(ProcessingLoopTest, StopReleasesSource) {
  auto loop = makeLoop(framesOf(frame_, 1), ErrorCode::None);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_NE(shared_->waitForUpdate(0, kWait), nullptr);
  EXPECT_TRUE(tracker_->open.load());

  loop->stop();

  EXPECT_EQ(loop->state(), LoopState::Stopped);
  EXPECT_EQ(loop->lastError(), ErrorCode::None);
  EXPECT_FALSE(tracker_->open.load());
  EXPECT_EQ(tracker_->closes.load(), tracker_->opens.load());

  uint64_t sequence = shared_->sequence();
  EXPECT_EQ(shared_->waitForUpdate(sequence, std::chrono::milliseconds(50)), nullptr);
}

TEST_F(ProcessingLoopTest, EncodingFailureKeepsPreviousPublish) {
  config_.frameSize = cv::Size(0, 0);
  config_.maxReadFailures = 1;
  std::vector<ScriptedFrameSource::Step> steps = {
    {ErrorCode::None, frame_},
    {ErrorCode::None, cv::Mat()},
  };
  auto loop = makeLoop(steps, ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_NE(shared_->waitForUpdate(0, kWait), nullptr);
  auto first = shared_->read();
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  auto last = shared_->read();
  EXPECT_EQ(last, first);
  EXPECT_EQ(last->sequence, 1u);
  EXPECT_EQ(last->stats.framesPublished, 1u);
  EXPECT_EQ(last->stats.encodeFailures, 0u);
  EXPECT_EQ(loop->lastError(), ErrorCode::EndOfStream);
}

TEST_F(ProcessingLoopTest, EncodingFailureIsCountedAndLoopContinues) {
  config_.frameSize = cv::Size(0, 0);
  config_.maxReadFailures = 1;
  std::vector<ScriptedFrameSource::Step> steps = {
    {ErrorCode::None, frame_},
    {ErrorCode::None, cv::Mat()},
    {ErrorCode::None, frame_},
  };
  auto loop = makeLoop(steps, ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));

  Statistics stats = shared_->readStats();
  EXPECT_EQ(stats.framesCaptured, 3u);
  EXPECT_EQ(stats.framesProcessed, 3u);
  EXPECT_EQ(stats.framesPublished, 2u);
  EXPECT_EQ(stats.encodeFailures, 1u);
  EXPECT_EQ(shared_->sequence(), 2u);
  EXPECT_NE(shared_->readFrame(), nullptr);
}

TEST_F(ProcessingLoopTest, ExceptionStopsWithProcessingFailed) {
  std::vector<ScriptedFrameSource::Step> steps = {
    {ErrorCode::None, frame_},
    {ErrorCode::None, cv::Mat(), true},
  };
  auto loop = makeLoop(steps, ErrorCode::EndOfStream);

  ASSERT_EQ(loop->start(), ErrorCode::None);
  ASSERT_TRUE(loop->waitUntilStopped(kWait));
  loop->stop();

  EXPECT_EQ(loop->lastError(), ErrorCode::ProcessingFailed);
  LoopStatus status = shared_->readStatus();
  EXPECT_EQ(status.state, "Stopped");
  EXPECT_EQ(status.lastError, ErrorCode::ProcessingFailed);
  EXPECT_EQ(status.detail, "scripted capture fault");
  EXPECT_EQ(shared_->readStats().framesPublished, 1u);
  EXPECT_FALSE(tracker_->open.load());
  EXPECT_EQ(tracker_->closes.load(), tracker_->opens.load());
}
