#include <chrono>

#include "heuristic_detector.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

HeuristicDetector::HeuristicDetector(const HeuristicParams &params, bool debug_mode)
    : initialized(false), debug_mode(debug_mode), params(params)
{
}

bool HeuristicDetector::initialize()
{
    initialized = false;

    if (!roi_processing::validateParams(params.roi) || !contour_processing::validateParams(params.contour))
    {
        log_error("Heuristic detector parameters rejected");
        return false;
    }

    if (params.minConfidence < 0.0f || params.minConfidence > 1.0f)
    {
        log_error("Minimum confidence must be in [0, 1]: " + log_string(params.minConfidence));
        return false;
    }

    clahe = roi_processing::createEnhancer(params.roi);
    morphKernel = contour_processing::createMorphKernel(params.contour);

    if (clahe.empty() || morphKernel.empty())
    {
        log_error("Failed to create processing kernels");
        return false;
    }

    initialized = true;
    log_debug("Heuristic detector ready (min confidence " + log_string(params.minConfidence) +
              ", rigorous " + log_string(params.score.rigorous) + ")");
    return true;
}

DetectionList HeuristicDetector::detect(const Mat &frame)
{
    DetectionList detections;

    if (!initialized || frame.empty())
    {
        return detections;
    }

    auto start_time = chrono::steady_clock::now();

    // Stage 1: road ROI, contrast enhancement, smoothing
    roi_processing::PreprocessedFrame pre = roi_processing::processROI(frame, clahe, debug_mode, params.roi);
    if (!pre.valid)
    {
        return detections;
    }

    // Stage 2: candidate regions
    vector<contour_processing::Candidate> candidates =
        contour_processing::processContours(pre, morphKernel, debug_mode, params.contour);

    // Stage 3: score and keep borderline-or-better candidates
    for (const auto &candidate : candidates)
    {
        score_processing::ScoreResult score = score_processing::processScore(candidate, pre.smoothed, params.score);

        if (debug_mode && score.rejection != score_processing::Rejection::NONE)
        {
            log_debug("Candidate at (" + to_string(candidate.box.x) + "," + to_string(candidate.box.y) +
                      ") rejected: " + score_processing::rejectionName(score.rejection));
        }

        if (score.confidence < params.minConfidence)
            continue;

        Rect2f box = roi_processing::toFrameCoordinates(candidate.box, pre);
        Detection detection;
        detection.x = box.x;
        detection.y = box.y;
        detection.w = box.width;
        detection.h = box.height;
        detection.confidence = score.confidence;
        detections.push_back(detection);
    }

    // Stage 4: drop duplicates, keep the best few
    detections = nms_processing::suppress(detections, params.nms);

    auto end_time = chrono::steady_clock::now();
    auto processing_time = chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count();
    if (debug_mode)
    {
        log_debug(to_string(candidates.size()) + " candidates, " + to_string(detections.size()) +
                  " detections in " + to_string(processing_time) + " ms");
    }

    return detections;
}
