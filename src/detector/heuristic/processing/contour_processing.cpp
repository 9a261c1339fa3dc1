#include "contour_processing.hpp"
#include "utils.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

namespace contour_processing
{
    bool validateParams(const ContourParams &params)
    {
        if (params.minAreaRatio < 0.0 || params.maxAreaRatio <= 0.0 || params.minAreaRatio > params.maxAreaRatio)
        {
            log_error("Invalid area ratio bounds: [" + log_string(params.minAreaRatio) + ", " + log_string(params.maxAreaRatio) + "]");
            return false;
        }
        if (params.maxAspectRatio < 1.0)
        {
            log_error("Aspect ratio ceiling must be >= 1: " + log_string(params.maxAspectRatio));
            return false;
        }
        if (params.morphKernelSize <= 0 || params.closeIterations < 0 || params.dilateIterations < 0)
        {
            log_error("Invalid morphology settings");
            return false;
        }
        return true;
    }

    Mat createMorphKernel(const ContourParams &params)
    {
        return getStructuringElement(params.morphShape, Size(params.morphKernelSize, params.morphKernelSize));
    }

    int medianIntensity(const Mat &gray)
    {
        if (gray.empty())
            return 0;

        int histSize = 256;
        float range[] = {0, 256};
        const float *histRange = {range};
        Mat hist;
        calcHist(&gray, 1, 0, Mat(), hist, 1, &histSize, &histRange);

        double half = gray.total() / 2.0;
        double cumulative = 0.0;
        for (int i = 0; i < histSize; i++)
        {
            cumulative += hist.at<float>(i);
            if (cumulative > half)
                return i;
        }
        return histSize - 1;
    }

    Mat buildEdgeMask(const Mat &smoothed, const Mat &kernel, const ContourParams &params)
    {
        // Step 1: Canny with thresholds that follow scene brightness
        int median = medianIntensity(smoothed);
        double lower = std::max(0.0, params.cannyLowerRatio * median);
        double upper = std::min(255.0, params.cannyUpperRatio * median);

        Mat edges;
        Canny(smoothed, edges, lower, upper);

        // Step 2: Close gaps in the rim, then connect nearby fragments
        morphologyEx(edges, edges, MORPH_CLOSE, kernel, Point(-1, -1), params.closeIterations);
        if (params.dilateIterations > 0)
        {
            dilate(edges, edges, kernel, Point(-1, -1), params.dilateIterations);
        }

        return edges;
    }

    vector<Candidate> processContours(
        const roi_processing::PreprocessedFrame &pre,
        const Mat &kernel,
        bool debug_mode,
        const ContourParams &params)
    {
        vector<Candidate> candidates;
        if (!pre.valid || pre.smoothed.empty())
        {
            return candidates;
        }

        Mat mask = buildEdgeMask(pre.smoothed, kernel, params);

        vector<vector<Point>> allContours;
        findContours(mask, allContours, params.contourMode, params.contourMethod);

        double roiArea = double(mask.cols) * mask.rows;
        double minArea = roiArea * params.minAreaRatio;
        double maxArea = roiArea * params.maxAreaRatio;
        Rect imageBounds(0, 0, pre.gray.cols, pre.gray.rows);

        for (const auto &contour : allContours)
        {
            double area = contourArea(contour);
            if (area < minArea || area > maxArea)
                continue;

            Rect box = boundingRect(contour) & imageBounds;
            if (box.width <= 0 || box.height <= 0)
                continue;

            double aspect = double(std::max(box.width, box.height)) / std::min(box.width, box.height);
            if (aspect > params.maxAspectRatio)
                continue;

            Candidate candidate;
            candidate.box = box;
            candidate.contour = contour;
            candidate.area = area;
            candidate.patch = pre.gray(box);
            candidates.push_back(candidate);
        }

        if (debug_mode)
        {
            log_debug("Kept " + log_string(candidates.size()) + " of " + log_string(allContours.size()) + " contours");
            debug::saveDebugImage("contour_processing", "edges", mask);
        }

        return candidates;
    }

} // namespace contour_processing
