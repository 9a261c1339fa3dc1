#pragma once

#include <opencv2/opencv.hpp>
#include "../detection.hpp"

using namespace cv;
using namespace std;

namespace nms_processing
{
    // Parameters for non-maximum suppression
    struct NmsParams
    {
        float iouThreshold = 0.3f;         // Boxes overlapping a kept box at or above this IoU are dropped
        int maxDetections = MAX_DETECTIONS; // Cap on the kept list
    };

    // Intersection over union of two boxes, 0 for disjoint or degenerate boxes
    float computeIoU(const Rect2f &a, const Rect2f &b);

    // Stable-sort by confidence (ties keep input order) and drop duplicates of kept boxes
    DetectionList suppress(const DetectionList &detections, const NmsParams &params = NmsParams());

} // namespace nms_processing
