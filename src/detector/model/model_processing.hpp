#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "../detection.hpp"

using namespace cv;
using namespace std;

namespace model_processing
{
    // Trained-model settings
    // Output contract: one float tensor [1, 4+K, N], rows cx, cy, w, h (input pixels) then K class scores
    struct ModelParams
    {
        string modelPath = "pothole_detector.onnx";
        vector<string> searchDirs = {"models", "/usr/local/share/openpothole/models"};

        int inputSize = 320;                 // Square network input
        float confThreshold = 0.1f;          // Internal cutoff, low to keep borderline boxes
        float nmsThreshold = 0.4f;           // IoU for duplicate removal
        int maxDetections = MAX_DETECTIONS;  // Cap on reported boxes
        float fallbackMinConfidence = 0.85f; // Heuristic cutoff when inference fails
    };

    // Paths probed in order: configured path, then <dir>/<file name> for each search dir
    vector<string> candidatePaths(const ModelParams &params);

    // Network input blob: RGB, scaled to [0,1], resized to inputSize x inputSize
    Mat prepareBlob(const Mat &frame, const ModelParams &params = ModelParams());

    // Decode the raw output tensor into normalized, suppressed detections.
    // Throws std::invalid_argument when the tensor does not follow the contract.
    DetectionList decodeOutput(const Mat &output, const ModelParams &params = ModelParams());

} // namespace model_processing
