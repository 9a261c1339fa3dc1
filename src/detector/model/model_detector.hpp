#pragma once

#include <memory>
#include <string>
#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include "../detector_interface.hpp"
#include "../heuristic/heuristic_detector.hpp"
#include "model_processing.hpp"

using namespace cv;
using namespace std;

// ONNX pothole detector on OpenCV DNN.
// A frame whose inference fails is handed to an owned heuristic detector instead.
class ModelDetector : public DetectorInterface
{
public:
    explicit ModelDetector(const model_processing::ModelParams &params = model_processing::ModelParams(),
                           const HeuristicParams &fallbackParams = HeuristicParams(),
                           bool debug_mode = false);
    virtual ~ModelDetector() = default;

    // Probe the search paths and load the network, false if no model could be loaded
    virtual bool initialize() override;
    virtual bool isInitialized() const override { return initialized; }
    virtual DetectionList detect(const Mat &frame) override;
    virtual string name() const override { return "model"; }

protected:
    // Forward pass, returns the raw output tensor
    virtual Mat runInference(const Mat &frame);

    void initializeFallback();
    DetectionList detectFallback(const Mat &frame);

    bool initialized;
    bool debug_mode;
    model_processing::ModelParams params;
    string loadedPath;
    dnn::Net net;
    unique_ptr<HeuristicDetector> fallback;
};
