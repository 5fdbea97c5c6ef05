#include <gtest/gtest.h>
#include "test_helpers.h"

TEST(ObjectDetectorTest, StartsUninitialized) {
    ScriptedDetector detector;
    EXPECT_EQ(detector.state(), DetectorState::Uninitialized);
    EXPECT_FALSE(detector.isReady());
}

TEST(ObjectDetectorTest, LoadsModelOnlyOnce) {
    ScriptedDetector detector;
    EXPECT_TRUE(detector.initialize());
    EXPECT_TRUE(detector.initialize());
    EXPECT_TRUE(detector.isReady());
    EXPECT_EQ(detector.loadCalls, 1);
}

TEST(ObjectDetectorTest, FailedLoadCanBeRetried) {
    ScriptedDetector detector;
    detector.failingLoads = 1;

    EXPECT_FALSE(detector.initialize());
    EXPECT_EQ(detector.state(), DetectorState::Failed);
    EXPECT_EQ(detector.lastError(), "model file missing");

    EXPECT_TRUE(detector.initialize());
    EXPECT_EQ(detector.state(), DetectorState::Ready);
    EXPECT_TRUE(detector.lastError().empty());
    EXPECT_EQ(detector.loadCalls, 2);
}

TEST(ObjectDetectorTest, DetectBeforeInitializeReturnsNothing) {
    ScriptedDetector detector;
    detector.setDefault({makeDetection("person", 0.9f)});
    EXPECT_TRUE(detector.detect(makeFrame()).empty());
    EXPECT_EQ(detector.inferenceCalls, 0);
}

TEST(ObjectDetectorTest, ZeroSizedFrameReturnsNothing) {
    ScriptedDetector detector;
    detector.setDefault({makeDetection("person", 0.9f)});
    ASSERT_TRUE(detector.initialize());

    EXPECT_TRUE(detector.detect(cv::Mat()).empty());
    EXPECT_EQ(detector.inferenceCalls, 0);
    EXPECT_EQ(detector.detect(makeFrame()).size(), 1u);
}

TEST(ObjectDetectorTest, InferenceErrorDegradesToEmpty) {
    ScriptedDetector detector;
    ASSERT_TRUE(detector.initialize());
    detector.throwOnInference = true;

    EXPECT_TRUE(detector.detect(makeFrame()).empty());
    EXPECT_TRUE(detector.isReady());
}

TEST(ObjectDetectorTest, StateNames) {
    EXPECT_STREQ(detectorStateName(DetectorState::Uninitialized), "uninitialized");
    EXPECT_STREQ(detectorStateName(DetectorState::Initializing), "initializing");
    EXPECT_STREQ(detectorStateName(DetectorState::Ready), "ready");

    ScriptedDetector detector;
    detector.failingLoads = 1;
    detector.initialize();
    EXPECT_STREQ(detectorStateName(detector.state()), "failed");
}
