#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "../detector_interface.hpp"
#include "../suppression/nms_processing.hpp"
#include "processing/roi_processing.hpp"
#include "processing/contour_processing.hpp"
#include "processing/score_processing.hpp"

using namespace cv;
using namespace std;

// All tunables of the classical pipeline
struct HeuristicParams
{
    float minConfidence = 0.20f; // Internal cutoff, low to keep borderline candidates
    roi_processing::ROIParams roi;
    contour_processing::ContourParams contour;
    score_processing::ScoreParams score;
    nms_processing::NmsParams nms;
};

// Contour-based pothole detector: ROI -> edges/contours -> scoring -> NMS
class HeuristicDetector : public DetectorInterface
{
public:
    explicit HeuristicDetector(const HeuristicParams &params = HeuristicParams(), bool debug_mode = false);
    virtual ~HeuristicDetector() = default;

    virtual bool initialize() override;
    virtual bool isInitialized() const override { return initialized; }
    virtual DetectionList detect(const Mat &frame) override;
    virtual string name() const override { return "heuristic"; }

protected:
    bool initialized;
    bool debug_mode;
    HeuristicParams params;

    // Built once in initialize(), shared read-only by every call
    Ptr<CLAHE> clahe;
    Mat morphKernel;
};
