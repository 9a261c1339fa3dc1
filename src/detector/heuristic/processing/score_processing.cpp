#include "score_processing.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

// Potholes are modeled as dark, roundish, textured regions darker than the asphalt around them.
// False positives (lane paint, shadows, tar seams) dominate, so in rigorous mode one strongly
// disqualifying signal vetoes the candidate whatever the other criteria say.

namespace score_processing
{
    string rejectionName(Rejection rejection)
    {
        switch (rejection)
        {
        case Rejection::NONE:
            return "NONE";
        case Rejection::SMALL_PATCH:
            return "SMALL_PATCH";
        case Rejection::TOO_BRIGHT:
            return "TOO_BRIGHT";
        case Rejection::LOW_CONTRAST:
            return "LOW_CONTRAST";
        case Rejection::IRREGULAR:
            return "IRREGULAR";
        case Rejection::ELONGATED:
            return "ELONGATED";
        case Rejection::UNIFORM:
            return "UNIFORM";
        default:
            return "UNKNOWN";
        }
    }

    static double clamp01(double value)
    {
        return std::min(std::max(value, 0.0), 1.0);
    }

    double computeCircularity(double area, double perimeter)
    {
        if (perimeter <= 0.0)
            return 0.0;
        return clamp01(4.0 * CV_PI * area / (perimeter * perimeter));
    }

    double computeConvexity(const vector<Point> &contour, double area)
    {
        if (contour.size() < 3)
            return 0.0;

        vector<Point> hull;
        convexHull(contour, hull);
        double hullArea = contourArea(hull);
        if (hullArea <= 0.0)
            return 0.0;

        return clamp01(area / hullArea);
    }

    double aspectStepScore(double aspect, const ScoreParams &params)
    {
        if (aspect <= params.aspectStep1)
            return 1.0;
        if (aspect <= params.aspectStep2)
            return 0.7;
        if (aspect <= params.aspectStep3)
            return 0.4;
        return 0.1;
    }

    Rect expandBox(const Rect &box, double margin, const Size &imageSize)
    {
        int pad = int(std::max(box.width, box.height) * margin);
        Rect grown(box.x - pad, box.y - pad, box.width + 2 * pad, box.height + 2 * pad);
        return grown & Rect(0, 0, imageSize.width, imageSize.height);
    }

    // Weighted sum without gates
    static ScoreResult scoreLenient(const contour_processing::Candidate &candidate, ScoreResult result, const ScoreParams &params)
    {
        double darkness = 1.0 - result.meanIntensity / 255.0;
        double contrast = std::min(result.stdDev / params.lenientContrastScale, 1.0);
        double aspect = aspectStepScore(result.aspectRatio, params);
        result.convexity = computeConvexity(candidate.contour, candidate.area);

        double total = darkness * params.lenientDarknessWeight +
                       contrast * params.lenientContrastWeight +
                       result.circularity * params.lenientCircularityWeight +
                       aspect * params.lenientAspectWeight +
                       result.convexity * params.lenientConvexityWeight;

        result.confidence = float(clamp01(total));
        return result;
    }

    static ScoreResult reject(ScoreResult result, Rejection reason)
    {
        result.confidence = 0.0f;
        result.rejection = reason;
        return result;
    }

    // Gated weighted sum
    static ScoreResult scoreRigorous(const contour_processing::Candidate &candidate, const Mat &neighborhood, ScoreResult result, const ScoreParams &params)
    {
        if ((int)candidate.patch.total() < params.minPatchPixels)
            return reject(result, Rejection::SMALL_PATCH);

        // 1. Darkness
        if (result.meanIntensity > params.maxMeanIntensity)
            return reject(result, Rejection::TOO_BRIGHT);
        double darkness = 1.0 - result.meanIntensity / params.maxMeanIntensity;

        // 2. Contrast against the surrounding asphalt
        double contrast = 0.0;
        Rect window = expandBox(candidate.box, params.neighborhoodMargin, neighborhood.size());
        if (window.area() > 0)
        {
            double neighborMean = mean(neighborhood(window))[0];
            result.contrastRatio = (neighborMean - result.meanIntensity) / (neighborMean + 1.0);
            if (result.contrastRatio < params.minContrastRatio)
                return reject(result, Rejection::LOW_CONTRAST);
            contrast = std::min(result.contrastRatio / params.contrastScale, 1.0);
        }

        // 3. Roundness
        if (result.circularity <= 0.0 || result.circularity < params.minCircularity)
            return reject(result, Rejection::IRREGULAR);
        double shape = std::min(result.circularity / params.circularityScale, 1.0);

        // 4. Elongation
        double aspectRigorous = double(std::max(candidate.box.width, candidate.box.height)) /
                                (std::min(candidate.box.width, candidate.box.height) + 1);
        if (aspectRigorous > params.maxAspectRatio)
            return reject(result, Rejection::ELONGATED);
        double aspect = clamp01(1.0 - (aspectRigorous - 1.0) / 2.0);

        // 5. Internal texture
        if (result.stdDev < params.minTextureStdDev)
            return reject(result, Rejection::UNIFORM);
        double texture = std::min(result.stdDev / params.textureScale, 1.0);

        double total = darkness * params.darknessWeight +
                       contrast * params.neighborhoodWeight +
                       shape * params.circularityWeight +
                       aspect * params.aspectWeight +
                       texture * params.textureWeight;

        result.confidence = float(clamp01(total));
        return result;
    }

    ScoreResult processScore(const contour_processing::Candidate &candidate, const Mat &neighborhood, const ScoreParams &params)
    {
        ScoreResult result;
        if (candidate.patch.empty() || candidate.box.width <= 0 || candidate.box.height <= 0)
        {
            result.rejection = Rejection::SMALL_PATCH;
            return result;
        }

        Scalar patchMean, patchStdDev;
        meanStdDev(candidate.patch, patchMean, patchStdDev);
        result.meanIntensity = patchMean[0];
        result.stdDev = patchStdDev[0];

        double perimeter = candidate.contour.size() >= 2 ? arcLength(candidate.contour, true) : 0.0;
        result.circularity = computeCircularity(candidate.area, perimeter);
        result.aspectRatio = double(std::max(candidate.box.width, candidate.box.height)) /
                             std::min(candidate.box.width, candidate.box.height);

        if (params.rigorous)
            return scoreRigorous(candidate, neighborhood, result, params);
        return scoreLenient(candidate, result, params);
    }

} // namespace score_processing
