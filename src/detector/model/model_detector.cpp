#include "model_detector.hpp"
#include "utils.hpp"
#include <fstream>

using namespace cv;
using namespace std;

ModelDetector::ModelDetector(const model_processing::ModelParams &params, const HeuristicParams &fallbackParams, bool debug_mode)
    : initialized(false), debug_mode(debug_mode), params(params)
{
    HeuristicParams strict = fallbackParams;
    strict.minConfidence = params.fallbackMinConfidence;
    fallback = make_unique<HeuristicDetector>(strict, debug_mode);
}

void ModelDetector::initializeFallback()
{
    if (!fallback->initialize())
    {
        log_warning("Per-frame heuristic fallback unavailable");
    }
}

bool ModelDetector::initialize()
{
    initialized = false;
    loadedPath.clear();
    initializeFallback();

    if (params.inputSize <= 0)
    {
        log_error("Model input size must be positive: " + log_string(params.inputSize));
        return false;
    }

    for (const auto &path : model_processing::candidatePaths(params))
    {
        ifstream probe(path, ios::binary);
        if (!probe.good())
            continue;

        try
        {
            net = dnn::readNetFromONNX(path);
            if (net.empty())
            {
                log_warning("Model file produced an empty network: " + path);
                continue;
            }
            net.setPreferableBackend(dnn::DNN_BACKEND_OPENCV);
            net.setPreferableTarget(dnn::DNN_TARGET_CPU);

            loadedPath = path;
            initialized = true;
            log_info("Loaded pothole model: " + path);
            return true;
        }
        catch (const exception &e)
        {
            log_warning("Failed to load model " + path + ": " + string(e.what()));
        }
    }

    log_warning("No usable pothole model found (searched for " + params.modelPath + ")");
    return false;
}

Mat ModelDetector::runInference(const Mat &frame)
{
    Mat blob = model_processing::prepareBlob(frame, params);
    net.setInput(blob);
    return net.forward();
}

DetectionList ModelDetector::detectFallback(const Mat &frame)
{
    if (fallback && fallback->isInitialized())
        return fallback->detect(frame);
    return DetectionList();
}

DetectionList ModelDetector::detect(const Mat &frame)
{
    if (frame.empty())
    {
        return DetectionList();
    }

    if (!initialized)
    {
        return detectFallback(frame);
    }

    try
    {
        Mat output = runInference(frame);
        return model_processing::decodeOutput(output, params);
    }
    catch (const exception &e)
    {
        log_warning("Inference with " + loadedPath + " failed, using heuristic for this frame: " + string(e.what()));
    }

    return detectFallback(frame);
}
