#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/opencv.hpp>
#include "detection.hpp"
#include "detector_config.hpp"
#include "detector_factory.hpp"

// Single entry point for pothole detection.
// Picks the best available detector once, applies the user-facing confidence cutoff
// and never lets a frame's failure escape detect().
class PotholeDetector
{
public:
    explicit PotholeDetector(const DetectorConfig &config = DetectorConfig(), bool debug_mode = false);

    // Wrap an already initialized detector (custom detectors, tests)
    PotholeDetector(std::unique_ptr<DetectorInterface> detector, DetectorMode mode, float min_confidence);

    // Detections for one frame, descending confidence, at most MAX_DETECTIONS. Never throws.
    DetectionList detect(const cv::Mat &frame);

    DetectorMode getMode() const { return mode; }
    bool isModelActive() const { return mode == DetectorMode::MODEL_ACTIVE; }
    std::string getDetectorName() const;

    // Single writer; takes effect from the next detect() call
    void setMinConfidence(float value);
    float getMinConfidence() const { return min_confidence.load(); }

    // Last detector output that completed without error
    const std::optional<DetectionList> &getLastResult() const { return last_result; }

private:
    std::unique_ptr<DetectorInterface> detector;
    DetectorMode mode;
    std::atomic<float> min_confidence;
    std::optional<DetectionList> last_result;
};
