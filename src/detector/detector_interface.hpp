#pragma once
#include <string>
#include <opencv2/opencv.hpp>
#include "detection.hpp"

// Abstract interface for any pothole detection method
class DetectorInterface
{
public:
    virtual ~DetectorInterface() = default;

    // Build per-instance state (kernels, networks), false if unusable
    virtual bool initialize() = 0;

    // Whether the detector is ready
    virtual bool isInitialized() const = 0;

    // Detect potholes in one BGR frame, may throw on processing errors
    virtual DetectionList detect(const cv::Mat &frame) = 0;

    // Short name for logs
    virtual std::string name() const = 0;
};
