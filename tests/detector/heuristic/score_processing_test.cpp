#include <gtest/gtest.h>
#include "detector/heuristic/processing/score_processing.hpp"
#include "test_helpers.hpp"

using namespace score_processing;
using contour_processing::Candidate;

// Bright asphalt with one dark square region, scored directly
class ScoreProcessingTest : public ::testing::Test
{
protected:
    ScoreParams params;
    Mat gray;

    void SetUp() override
    {
        gray = Mat(200, 200, CV_8UC1, Scalar(200));
    }

    // Fill a region with a flat value or with texture around it
    void paint(const Rect &region, int value, int texture = 0)
    {
        Mat area = gray(region);
        if (texture > 0)
        {
            RNG rng(7);
            rng.fill(area, RNG::UNIFORM, Scalar(value - texture), Scalar(value + texture + 1));
        }
        else
        {
            area.setTo(Scalar(value));
        }
    }

    Candidate candidateFor(const Rect &box)
    {
        Candidate c;
        c.box = box;
        c.contour = {box.tl(), Point(box.br().x - 1, box.y), Point(box.br().x - 1, box.br().y - 1), Point(box.x, box.br().y - 1)};
        c.area = contourArea(c.contour);
        c.patch = gray(box);
        return c;
    }
};

TEST(ScoreHelpersTest, CircularityOfPerfectCircleIsOne)
{
    double r = 10.0;
    EXPECT_NEAR(computeCircularity(CV_PI * r * r, 2.0 * CV_PI * r), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(computeCircularity(100.0, 0.0), 0.0);
}

TEST(ScoreHelpersTest, ConvexityOfSquareIsOne)
{
    vector<Point> square = {Point(0, 0), Point(10, 0), Point(10, 10), Point(0, 10)};
    EXPECT_NEAR(computeConvexity(square, contourArea(square)), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(computeConvexity({Point(0, 0), Point(1, 1)}, 0.0), 0.0);
}

TEST(ScoreHelpersTest, AspectSteps)
{
    EXPECT_DOUBLE_EQ(aspectStepScore(1.0), 1.0);
    EXPECT_DOUBLE_EQ(aspectStepScore(1.5), 1.0);
    EXPECT_DOUBLE_EQ(aspectStepScore(2.0), 0.7);
    EXPECT_DOUBLE_EQ(aspectStepScore(3.0), 0.4);
    EXPECT_DOUBLE_EQ(aspectStepScore(6.0), 0.1);
}

TEST(ScoreHelpersTest, ExpandBoxClipsToImage)
{
    Rect grown = expandBox(Rect(10, 10, 20, 20), 0.5, Size(100, 100));
    EXPECT_EQ(grown, Rect(0, 0, 40, 40));

    grown = expandBox(Rect(40, 40, 20, 20), 0.5, Size(100, 100));
    EXPECT_EQ(grown, Rect(30, 30, 40, 40));
}

TEST_F(ScoreProcessingTest, TexturedDarkRegionIsAccepted)
{
    Rect box(70, 70, 60, 60);
    paint(box, 60, 40);

    ScoreResult result = processScore(candidateFor(box), gray, params);
    EXPECT_EQ(result.rejection, Rejection::NONE);
    EXPECT_GT(result.confidence, 0.6f);
    EXPECT_LE(result.confidence, 1.0f);
    EXPECT_NEAR(result.meanIntensity, 60.0, 3.0);
    EXPECT_GT(result.contrastRatio, 0.4);
}

TEST_F(ScoreProcessingTest, SmallPatchIsRejected)
{
    Rect box(90, 90, 8, 8);
    paint(box, 40, 20);

    ScoreResult result = processScore(candidateFor(box), gray, params);
    EXPECT_EQ(result.rejection, Rejection::SMALL_PATCH);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST_F(ScoreProcessingTest, BrightRegionIsRejected)
{
    Rect box(70, 70, 60, 60);
    paint(box, 150);

    ScoreResult result = processScore(candidateFor(box), gray, params);
    EXPECT_EQ(result.rejection, Rejection::TOO_BRIGHT);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST_F(ScoreProcessingTest, RegionLikeItsSurroundingsIsRejected)
{
    gray.setTo(Scalar(100));
    Rect box(70, 70, 60, 60);

    ScoreResult result = processScore(candidateFor(box), gray, params);
    EXPECT_EQ(result.rejection, Rejection::LOW_CONTRAST);
}

TEST_F(ScoreProcessingTest, IrregularShapeIsRejected)
{
    Rect box(70, 70, 60, 60);
    paint(box, 60, 40);

    Candidate candidate = candidateFor(box);
    candidate.area = 10.0;

    EXPECT_EQ(processScore(candidate, gray, params).rejection, Rejection::IRREGULAR);
}

TEST_F(ScoreProcessingTest, ElongatedRegionIsRejected)
{
    Rect box(50, 90, 90, 20);
    paint(box, 60, 40);

    EXPECT_EQ(processScore(candidateFor(box), gray, params).rejection, Rejection::ELONGATED);
}

TEST_F(ScoreProcessingTest, FlatShadowIsRejected)
{
    Rect box(70, 70, 60, 60);
    paint(box, 60);

    ScoreResult result = processScore(candidateFor(box), gray, params);
    EXPECT_EQ(result.rejection, Rejection::UNIFORM);
    EXPECT_EQ(rejectionName(result.rejection), "UNIFORM");
}

TEST_F(ScoreProcessingTest, LenientModeHasNoGates)
{
    Rect box(70, 70, 60, 60);
    paint(box, 60);
    params.rigorous = false;

    ScoreResult result = processScore(candidateFor(box), gray, params);
    EXPECT_EQ(result.rejection, Rejection::NONE);
    EXPECT_GT(result.confidence, 0.5f);
    EXPECT_LT(result.confidence, 1.0f);
    EXPECT_NEAR(result.convexity, 1.0, 1e-6);
}

TEST_F(ScoreProcessingTest, EmptyPatchScoresZero)
{
    Candidate candidate;
    ScoreResult result = processScore(candidate, gray, params);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST_F(ScoreProcessingTest, ContrastUsesNeighborhoodImage)
{
    Rect box(70, 70, 60, 60);
    paint(box, 60, 40);
    Candidate candidate = candidateFor(box);

    // Patch statistics stay on the raw patch, only the surroundings change
    Mat brightSurroundings(gray.size(), CV_8UC1, Scalar(200));
    ScoreResult bright = processScore(candidate, brightSurroundings, params);
    EXPECT_EQ(bright.rejection, Rejection::NONE);
    EXPECT_NEAR(bright.contrastRatio, (200.0 - bright.meanIntensity) / 201.0, 1e-6);

    Mat darkSurroundings(gray.size(), CV_8UC1, Scalar(62));
    ScoreResult dark = processScore(candidate, darkSurroundings, params);
    EXPECT_EQ(dark.rejection, Rejection::LOW_CONTRAST);
    EXPECT_NEAR(dark.meanIntensity, bright.meanIntensity, 1e-9);
}
