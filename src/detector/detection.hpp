#pragma once
#include <vector>
#include <opencv2/opencv.hpp>

// A single pothole detection in normalized full-frame coordinates
// x, y, w, h are fractions of frame width/height (top-left origin)
struct Detection
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
    float confidence = 0.0f;

    cv::Rect2f box() const { return cv::Rect2f(x, y, w, h); }

    bool operator==(const Detection &other) const
    {
        return x == other.x && y == other.y && w == other.w && h == other.h && confidence == other.confidence;
    }
};

// Ordered by descending confidence
using DetectionList = std::vector<Detection>;

// Upper bound on detections reported per frame
static const int MAX_DETECTIONS = 5;
