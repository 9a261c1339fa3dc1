#include "model_processing.hpp"
#include "../suppression/nms_processing.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace model_processing
{
    vector<string> candidatePaths(const ModelParams &params)
    {
        vector<string> paths;
        if (params.modelPath.empty())
            return paths;

        paths.push_back(params.modelPath);

        size_t slash = params.modelPath.find_last_of('/');
        string fileName = slash == string::npos ? params.modelPath : params.modelPath.substr(slash + 1);
        for (const auto &dir : params.searchDirs)
        {
            if (dir.empty())
                continue;
            string path = dir.back() == '/' ? dir + fileName : dir + "/" + fileName;
            if (find(paths.begin(), paths.end(), path) == paths.end())
                paths.push_back(path);
        }
        return paths;
    }

    Mat prepareBlob(const Mat &frame, const ModelParams &params)
    {
        Mat bgr;
        if (frame.channels() == 1)
            cvtColor(frame, bgr, COLOR_GRAY2BGR);
        else if (frame.channels() == 4)
            cvtColor(frame, bgr, COLOR_BGRA2BGR);
        else
            bgr = frame;

        return dnn::blobFromImage(bgr, 1.0 / 255.0, Size(params.inputSize, params.inputSize),
                                  Scalar(0, 0, 0), true, false);
    }

    DetectionList decodeOutput(const Mat &output, const ModelParams &params)
    {
        if (output.dims != 3 || output.size[0] != 1 || output.size[1] < 5 || output.type() != CV_32F)
        {
            throw invalid_argument("model output must be a float tensor [1, 4+K, N]");
        }
        if (params.inputSize <= 0)
        {
            throw invalid_argument("model input size must be positive");
        }

        int attributes = output.size[1];
        int count = output.size[2];
        Mat table(attributes, count, CV_32F, const_cast<float *>(output.ptr<float>()));
        float inputSize = float(params.inputSize);

        DetectionList detections;
        for (int i = 0; i < count; i++)
        {
            float confidence = 0.0f;
            for (int a = 4; a < attributes; a++)
                confidence = std::max(confidence, table.at<float>(a, i));

            float cx = table.at<float>(0, i);
            float cy = table.at<float>(1, i);
            float bw = table.at<float>(2, i);
            float bh = table.at<float>(3, i);
            if (!std::isfinite(cx) || !std::isfinite(cy) || !std::isfinite(bw) || !std::isfinite(bh) ||
                !std::isfinite(confidence))
                continue;

            if (confidence < params.confThreshold)
                continue;

            float w = bw / inputSize;
            float h = bh / inputSize;
            float x = cx / inputSize - w / 2.0f;
            float y = cy / inputSize - h / 2.0f;

            Detection detection;
            detection.x = std::min(std::max(x, 0.0f), 1.0f);
            detection.y = std::min(std::max(y, 0.0f), 1.0f);
            detection.w = std::min(std::max(w, 0.0f), 1.0f - detection.x);
            detection.h = std::min(std::max(h, 0.0f), 1.0f - detection.y);
            detection.confidence = std::min(confidence, 1.0f);
            detections.push_back(detection);
        }

        nms_processing::NmsParams nms;
        nms.iouThreshold = params.nmsThreshold;
        nms.maxDetections = params.maxDetections;
        return nms_processing::suppress(detections, nms);
    }

} // namespace model_processing
