#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include "contour_processing.hpp"

using namespace cv;
using namespace std;

namespace score_processing
{
    // Scoring weights and gates. Values are empirically tuned defaults, not derived constants.
    struct ScoreParams
    {
        bool rigorous = true; // Hard rejection gates + neighborhood contrast

        // Lenient mode weights (sum to 1)
        float lenientDarknessWeight = 0.25f;
        float lenientContrastWeight = 0.20f;
        float lenientCircularityWeight = 0.25f;
        float lenientAspectWeight = 0.15f;
        float lenientConvexityWeight = 0.15f;
        double lenientContrastScale = 50.0; // Patch stddev giving full contrast score

        // Lenient aspect steps: <=1.5 -> 1.0, <=2.5 -> 0.7, <=4.0 -> 0.4, beyond -> 0.1
        double aspectStep1 = 1.5;
        double aspectStep2 = 2.5;
        double aspectStep3 = 4.0;

        // Rigorous mode weights (sum to 1)
        float darknessWeight = 0.35f;
        float neighborhoodWeight = 0.25f;
        float circularityWeight = 0.20f;
        float aspectWeight = 0.10f;
        float textureWeight = 0.10f;

        // Rigorous gates
        int minPatchPixels = 100;           // Patches smaller than this cannot be judged
        double maxMeanIntensity = 120.0;    // Brighter than this is not a pothole
        double neighborhoodMargin = 0.5;    // Margin around the box, fraction of max(w,h)
        double minContrastRatio = 0.15;     // Must be this much darker than its surroundings
        double contrastScale = 0.4;         // Contrast ratio giving full contrast score
        double minCircularity = 0.2;        // Very irregular shapes are cracks or debris
        double circularityScale = 0.6;      // Circularity giving full shape score
        double maxAspectRatio = 3.0;        // Longer shapes are lane markings or seams
        double minTextureStdDev = 5.0;      // Flatter than this is a shadow
        double textureScale = 30.0;         // Stddev giving full texture score
    };

    // Why a candidate was vetoed in rigorous mode
    enum class Rejection
    {
        NONE,
        SMALL_PATCH,
        TOO_BRIGHT,
        LOW_CONTRAST,
        IRREGULAR,
        ELONGATED,
        UNIFORM
    };

    // Per-criterion breakdown for one candidate
    struct ScoreResult
    {
        float confidence = 0.0f;              // Final score in [0,1]
        Rejection rejection = Rejection::NONE; // Gate that vetoed the candidate
        double meanIntensity = 0.0;
        double stdDev = 0.0;
        double circularity = 0.0;
        double aspectRatio = 0.0;
        double contrastRatio = 0.0;
        double convexity = 0.0;
    };

    string rejectionName(Rejection rejection);

    // 4*pi*area / perimeter^2 clamped to [0,1], 0 for a degenerate perimeter
    double computeCircularity(double area, double perimeter);

    // Contour area over convex hull area, 0 for a degenerate hull
    double computeConvexity(const vector<Point> &contour, double area);

    // Step score for bounding-box elongation
    double aspectStepScore(double aspect, const ScoreParams &params = ScoreParams());

    // Box grown by margin*max(w,h) on every side, clipped to the image
    Rect expandBox(const Rect &box, double margin, const Size &imageSize);

    // Score one candidate. Patch statistics come from candidate.patch (pre-enhancement gray);
    // neighborhood is the enhanced, smoothed ROI the surrounding-asphalt mean is taken from
    ScoreResult processScore(
        const contour_processing::Candidate &candidate,
        const Mat &neighborhood,
        const ScoreParams &params = ScoreParams());

} // namespace score_processing
