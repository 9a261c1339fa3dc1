#include "pothole_detector.hpp"
#include "utils.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

static float clampConfidence(float value)
{
    return std::min(std::max(value, 0.0f), 1.0f);
}

PotholeDetector::PotholeDetector(const DetectorConfig &config, bool debug_mode)
    : mode(DetectorMode::INACTIVE), min_confidence(0.0f)
{
    DetectorSelection selection = DetectorFactory::createDetector(config, debug_mode);
    detector = std::move(selection.detector);
    mode = selection.mode;

    float cutoff = mode == DetectorMode::MODEL_ACTIVE ? config.modelMinConfidence : config.heuristicMinConfidence;
    min_confidence.store(clampConfidence(cutoff));

    log_info("Detector mode " + detectorModeName(mode) + ", minimum confidence " + log_string(min_confidence.load()));
}

PotholeDetector::PotholeDetector(unique_ptr<DetectorInterface> detector, DetectorMode mode, float min_confidence)
    : detector(std::move(detector)), mode(mode), min_confidence(clampConfidence(min_confidence))
{
    if (!this->detector)
    {
        this->mode = DetectorMode::INACTIVE;
    }
}

string PotholeDetector::getDetectorName() const
{
    if (mode == DetectorMode::INACTIVE || !detector)
        return "none";
    return detector->name();
}

void PotholeDetector::setMinConfidence(float value)
{
    min_confidence.store(clampConfidence(value));
}

DetectionList PotholeDetector::detect(const Mat &frame)
{
    // Read once, a concurrent update applies to the next call
    float cutoff = min_confidence.load();

    if (mode == DetectorMode::INACTIVE || !detector || frame.empty())
    {
        return DetectionList();
    }

    DetectionList raw;
    try
    {
        raw = detector->detect(frame);
        last_result = raw;
    }
    catch (const exception &e)
    {
        log_warning("Detection failed on " + detector->name() + " detector: " + string(e.what()));
        if (last_result)
            raw = *last_result;
    }
    catch (...)
    {
        log_warning("Detection failed on " + detector->name() + " detector: unknown exception");
        if (last_result)
            raw = *last_result;
    }

    DetectionList filtered;
    for (const auto &detection : raw)
    {
        if (detection.confidence >= cutoff)
            filtered.push_back(detection);
        if ((int)filtered.size() >= MAX_DETECTIONS)
            break;
    }
    return filtered;
}
