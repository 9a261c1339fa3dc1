#include <gtest/gtest.h>
#include "detector/heuristic/processing/contour_processing.hpp"
#include "test_helpers.hpp"

using namespace contour_processing;
using namespace test_helpers;

class ContourProcessingTest : public ::testing::Test
{
protected:
    roi_processing::ROIParams roiParams;
    ContourParams params;
    Ptr<CLAHE> clahe;
    Mat kernel;

    void SetUp() override
    {
        clahe = roi_processing::createEnhancer(roiParams);
        kernel = createMorphKernel(params);
    }

    vector<Candidate> extract(const Mat &frame, const ContourParams &p)
    {
        roi_processing::PreprocessedFrame pre = roi_processing::processROI(frame, clahe, false, roiParams);
        return processContours(pre, kernel, false, p);
    }

    vector<Candidate> extract(const Mat &frame)
    {
        return extract(frame, params);
    }
};

TEST(MedianIntensityTest, PicksMiddleValue)
{
    Mat values = (Mat_<uchar>(1, 5) << 10, 50, 10, 50, 10);
    EXPECT_EQ(medianIntensity(values), 10);

    Mat flat(20, 20, CV_8UC1, Scalar(77));
    EXPECT_EQ(medianIntensity(flat), 77);

    EXPECT_EQ(medianIntensity(Mat()), 0);
}

TEST_F(ContourProcessingTest, UniformImageHasNoEdges)
{
    Mat smoothed(100, 100, CV_8UC1, Scalar(128));
    EXPECT_EQ(countNonZero(buildEdgeMask(smoothed, kernel, params)), 0);
}

TEST_F(ContourProcessingTest, DarkCircleGivesOneCandidate)
{
    vector<Candidate> candidates = extract(frameWithDarkCircle(Point(320, 340), 40));
    ASSERT_EQ(candidates.size(), 1u);

    const Candidate &c = candidates[0];
    // Circle center in ROI pixels
    EXPECT_TRUE(c.box.contains(Point(320, 340 - 192)));
    EXPECT_EQ(c.patch.size(), c.box.size());
    EXPECT_GT(c.area, 0.0);
    EXPECT_FALSE(c.contour.empty());
}

TEST_F(ContourProcessingTest, UniformFrameGivesNoCandidates)
{
    EXPECT_TRUE(extract(uniformFrame()).empty());
}

TEST_F(ContourProcessingTest, InvalidFrameGivesNoCandidates)
{
    roi_processing::PreprocessedFrame pre;
    EXPECT_TRUE(processContours(pre, kernel, false, params).empty());
}

TEST_F(ContourProcessingTest, TinyBlobsAreFiltered)
{
    EXPECT_TRUE(extract(frameWithDarkCircle(Point(320, 340), 5)).empty());
}

TEST_F(ContourProcessingTest, ElongatedStripsAreFiltered)
{
    Mat frame = uniformFrame(640, 480, 200);
    rectangle(frame, Rect(100, 330, 300, 20), Scalar::all(30), -1);
    EXPECT_TRUE(extract(frame).empty());
}

TEST_F(ContourProcessingTest, AreaCeilingApplies)
{
    ContourParams tight = params;
    tight.maxAreaRatio = 0.005;
    EXPECT_TRUE(extract(frameWithDarkCircle(Point(320, 340), 40), tight).empty());
}

TEST(ContourParamsTest, RejectsInvalidParams)
{
    ContourParams bad;
    bad.minAreaRatio = 0.2;
    bad.maxAreaRatio = 0.1;
    EXPECT_FALSE(validateParams(bad));

    bad = ContourParams();
    bad.maxAspectRatio = 0.5;
    EXPECT_FALSE(validateParams(bad));

    bad = ContourParams();
    bad.morphKernelSize = 0;
    EXPECT_FALSE(validateParams(bad));

    EXPECT_TRUE(validateParams(ContourParams()));
}
