#include <gtest/gtest.h>
#include "detector/heuristic/heuristic_detector.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

class HeuristicDetectorTest : public ::testing::Test
{
protected:
    HeuristicDetector detector;

    void SetUp() override
    {
        ASSERT_TRUE(detector.initialize());
    }
};

TEST(HeuristicDetectorSetupTest, UninitializedDetectorReturnsNothing)
{
    HeuristicDetector detector;
    EXPECT_FALSE(detector.isInitialized());
    EXPECT_TRUE(detector.detect(frameWithDarkCircle()).empty());
}

TEST(HeuristicDetectorSetupTest, InvalidParamsFailInitialization)
{
    HeuristicParams params;
    params.roi.roiStartFraction = 1.5f;
    HeuristicDetector detector(params);
    EXPECT_FALSE(detector.initialize());
    EXPECT_FALSE(detector.isInitialized());

    params = HeuristicParams();
    params.minConfidence = 2.0f;
    HeuristicDetector strict(params);
    EXPECT_FALSE(strict.initialize());
}

TEST_F(HeuristicDetectorTest, EmptyFrame)
{
    EXPECT_TRUE(detector.detect(Mat()).empty());
}

TEST_F(HeuristicDetectorTest, UniformFrame)
{
    EXPECT_TRUE(detector.detect(uniformFrame()).empty());
}

TEST_F(HeuristicDetectorTest, FindsDarkCircle)
{
    DetectionList detections = detector.detect(frameWithDarkCircle(Point(320, 340), 40));
    ASSERT_EQ(detections.size(), 1u);
    expectWellFormed(detections);

    const Detection &d = detections[0];
    EXPECT_GT(d.confidence, 0.6f);
    // Box covers the circle center (0.5, 0.708)
    EXPECT_TRUE(d.box().contains(Point2f(0.5f, 340.0f / 480.0f)));
    EXPECT_NEAR(d.w, 80.0f / 640.0f, 0.03f);
    EXPECT_NEAR(d.h, 80.0f / 480.0f, 0.03f);
}

TEST_F(HeuristicDetectorTest, OverlappingCirclesGiveOneDetection)
{
    DetectionList detections = detector.detect(frameWithDarkCircles({Point(300, 340), Point(330, 340)}, 40));
    EXPECT_EQ(detections.size(), 1u);
    expectWellFormed(detections);
}

TEST_F(HeuristicDetectorTest, SeparateCirclesGiveSeparateDetections)
{
    DetectionList detections = detector.detect(frameWithDarkCircles({Point(160, 340), Point(480, 340)}, 40));
    ASSERT_EQ(detections.size(), 2u);
    expectWellFormed(detections);
    EXPECT_NE(detections[0].x, detections[1].x);
}

TEST_F(HeuristicDetectorTest, IgnoresDarkRegionAboveRoadBand)
{
    EXPECT_TRUE(detector.detect(frameWithDarkCircle(Point(320, 90), 40)).empty());
}

TEST_F(HeuristicDetectorTest, IgnoresBrightBlob)
{
    Mat frame = uniformFrame(640, 480, 60);
    circle(frame, Point(320, 340), 40, Scalar::all(230), -1);
    EXPECT_TRUE(detector.detect(frame).empty());
}

TEST_F(HeuristicDetectorTest, IgnoresLaneMarking)
{
    Mat frame = uniformFrame(640, 480, 200);
    rectangle(frame, Rect(100, 330, 300, 20), Scalar::all(30), -1);
    EXPECT_TRUE(detector.detect(frame).empty());
}

TEST_F(HeuristicDetectorTest, WideFramesMapBackToFrameCoordinates)
{
    DetectionList detections = detector.detect(frameWithDarkCircle(Point(640, 510), 80, 1280, 720));
    ASSERT_EQ(detections.size(), 1u);
    expectWellFormed(detections);
    EXPECT_NEAR(detections[0].x + detections[0].w / 2.0f, 0.5f, 0.03f);
    EXPECT_NEAR(detections[0].y + detections[0].h / 2.0f, 510.0f / 720.0f, 0.03f);
}

TEST_F(HeuristicDetectorTest, RepeatedCallsAgree)
{
    Mat frame = frameWithDarkCircles({Point(160, 340), Point(480, 360)}, 40);
    EXPECT_EQ(detector.detect(frame), detector.detect(frame));
}

TEST_F(HeuristicDetectorTest, AcceptsGrayscaleFrames)
{
    Mat gray;
    cvtColor(frameWithDarkCircle(), gray, COLOR_BGR2GRAY);
    EXPECT_EQ(detector.detect(gray).size(), 1u);
}
