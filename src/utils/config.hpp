#pragma once

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "logging.hpp"
#include "detector/detector_config.hpp"

using json = nlohmann::json;

// JSON configuration for the detector. Every key is optional; missing keys keep their defaults.
//
// {
//   "model_min_confidence": 0.5,
//   "heuristic_min_confidence": 0.6,
//   "heuristic_only": false,
//   "model": { "path": "pothole_detector.onnx", "search_dirs": ["models"], "input_size": 320, ... },
//   "heuristic": { "min_confidence": 0.2, "nms_threshold": 0.3, "roi": {...}, "contour": {...}, "score": {...} }
// }
namespace config
{
    template <typename T>
    inline void readValue(const json &j, const char *key, T &out)
    {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
        {
            out = it->get<T>();
        }
    }

    inline const json &section(const json &j, const char *key)
    {
        static const json empty = json::object();
        auto it = j.find(key);
        if (it == j.end())
            return empty;
        if (!it->is_object())
            throw invalid_argument(string("\"") + key + "\" must be an object");
        return *it;
    }

    inline void readRoi(const json &j, roi_processing::ROIParams &roi)
    {
        readValue(j, "start_fraction", roi.roiStartFraction);
        readValue(j, "max_processing_width", roi.maxProcessingWidth);
        readValue(j, "clahe_clip_limit", roi.claheClipLimit);
        readValue(j, "clahe_tile_grid", roi.claheTileGrid);
        readValue(j, "bilateral_diameter", roi.bilateralDiameter);
        readValue(j, "bilateral_sigma_color", roi.bilateralSigmaColor);
        readValue(j, "bilateral_sigma_space", roi.bilateralSigmaSpace);
    }

    inline void readContour(const json &j, contour_processing::ContourParams &contour)
    {
        readValue(j, "canny_lower_ratio", contour.cannyLowerRatio);
        readValue(j, "canny_upper_ratio", contour.cannyUpperRatio);
        readValue(j, "morph_kernel_size", contour.morphKernelSize);
        readValue(j, "close_iterations", contour.closeIterations);
        readValue(j, "dilate_iterations", contour.dilateIterations);
        readValue(j, "min_area_ratio", contour.minAreaRatio);
        readValue(j, "max_area_ratio", contour.maxAreaRatio);
        readValue(j, "max_aspect_ratio", contour.maxAspectRatio);
    }

    inline void readScore(const json &j, score_processing::ScoreParams &score)
    {
        readValue(j, "rigorous", score.rigorous);

        const json &lenient = section(j, "lenient_weights");
        readValue(lenient, "darkness", score.lenientDarknessWeight);
        readValue(lenient, "contrast", score.lenientContrastWeight);
        readValue(lenient, "circularity", score.lenientCircularityWeight);
        readValue(lenient, "aspect", score.lenientAspectWeight);
        readValue(lenient, "convexity", score.lenientConvexityWeight);
        readValue(j, "lenient_contrast_scale", score.lenientContrastScale);

        const json &weights = section(j, "weights");
        readValue(weights, "darkness", score.darknessWeight);
        readValue(weights, "neighborhood", score.neighborhoodWeight);
        readValue(weights, "circularity", score.circularityWeight);
        readValue(weights, "aspect", score.aspectWeight);
        readValue(weights, "texture", score.textureWeight);

        readValue(j, "min_patch_pixels", score.minPatchPixels);
        readValue(j, "max_mean_intensity", score.maxMeanIntensity);
        readValue(j, "neighborhood_margin", score.neighborhoodMargin);
        readValue(j, "min_contrast_ratio", score.minContrastRatio);
        readValue(j, "contrast_scale", score.contrastScale);
        readValue(j, "min_circularity", score.minCircularity);
        readValue(j, "circularity_scale", score.circularityScale);
        readValue(j, "max_aspect_ratio", score.maxAspectRatio);
        readValue(j, "min_texture_stddev", score.minTextureStdDev);
        readValue(j, "texture_scale", score.textureScale);
    }

    inline void readHeuristic(const json &j, HeuristicParams &heuristic)
    {
        readValue(j, "min_confidence", heuristic.minConfidence);
        readValue(j, "nms_threshold", heuristic.nms.iouThreshold);
        readValue(j, "max_detections", heuristic.nms.maxDetections);
        readRoi(section(j, "roi"), heuristic.roi);
        readContour(section(j, "contour"), heuristic.contour);
        readScore(section(j, "score"), heuristic.score);
    }

    inline void readModel(const json &j, model_processing::ModelParams &model)
    {
        readValue(j, "path", model.modelPath);
        readValue(j, "search_dirs", model.searchDirs);
        readValue(j, "input_size", model.inputSize);
        readValue(j, "confidence_threshold", model.confThreshold);
        readValue(j, "nms_threshold", model.nmsThreshold);
        readValue(j, "max_detections", model.maxDetections);
        readValue(j, "fallback_min_confidence", model.fallbackMinConfidence);
    }

    // Parse JSON text into config. On any error config is left untouched and false is returned.
    inline bool parse(const string &text, DetectorConfig &config)
    {
        try
        {
            json root = json::parse(text);
            if (!root.is_object())
            {
                log_error("Configuration root must be a JSON object");
                return false;
            }

            DetectorConfig parsed = config;
            readValue(root, "model_min_confidence", parsed.modelMinConfidence);
            readValue(root, "heuristic_min_confidence", parsed.heuristicMinConfidence);
            readValue(root, "heuristic_only", parsed.heuristicOnly);
            readModel(section(root, "model"), parsed.model);
            readHeuristic(section(root, "heuristic"), parsed.heuristic);

            config = parsed;
            return true;
        }
        catch (const exception &e)
        {
            log_error("Invalid configuration: " + string(e.what()));
            return false;
        }
    }

    // Load a JSON configuration file
    inline bool load(const string &path, DetectorConfig &config)
    {
        ifstream file(path);
        if (!file)
        {
            log_error("Cannot open configuration file: " + path);
            return false;
        }

        stringstream buffer;
        buffer << file.rdbuf();
        if (!parse(buffer.str(), config))
        {
            log_error("Keeping default configuration, failed to parse " + path);
            return false;
        }

        log_info("Loaded configuration from " + path);
        return true;
    }

    // Effective configuration, same layout as the file format
    inline json toJson(const DetectorConfig &config)
    {
        const HeuristicParams &h = config.heuristic;
        const model_processing::ModelParams &m = config.model;

        json root;
        root["model_min_confidence"] = config.modelMinConfidence;
        root["heuristic_min_confidence"] = config.heuristicMinConfidence;
        root["heuristic_only"] = config.heuristicOnly;

        root["model"] = {
            {"path", m.modelPath},
            {"search_dirs", m.searchDirs},
            {"input_size", m.inputSize},
            {"confidence_threshold", m.confThreshold},
            {"nms_threshold", m.nmsThreshold},
            {"max_detections", m.maxDetections},
            {"fallback_min_confidence", m.fallbackMinConfidence}};

        json heuristic;
        heuristic["min_confidence"] = h.minConfidence;
        heuristic["nms_threshold"] = h.nms.iouThreshold;
        heuristic["max_detections"] = h.nms.maxDetections;
        heuristic["roi"] = {
            {"start_fraction", h.roi.roiStartFraction},
            {"max_processing_width", h.roi.maxProcessingWidth},
            {"clahe_clip_limit", h.roi.claheClipLimit},
            {"clahe_tile_grid", h.roi.claheTileGrid},
            {"bilateral_diameter", h.roi.bilateralDiameter},
            {"bilateral_sigma_color", h.roi.bilateralSigmaColor},
            {"bilateral_sigma_space", h.roi.bilateralSigmaSpace}};
        heuristic["contour"] = {
            {"canny_lower_ratio", h.contour.cannyLowerRatio},
            {"canny_upper_ratio", h.contour.cannyUpperRatio},
            {"morph_kernel_size", h.contour.morphKernelSize},
            {"close_iterations", h.contour.closeIterations},
            {"dilate_iterations", h.contour.dilateIterations},
            {"min_area_ratio", h.contour.minAreaRatio},
            {"max_area_ratio", h.contour.maxAreaRatio},
            {"max_aspect_ratio", h.contour.maxAspectRatio}};
        heuristic["score"] = {
            {"rigorous", h.score.rigorous},
            {"lenient_weights", {{"darkness", h.score.lenientDarknessWeight}, {"contrast", h.score.lenientContrastWeight}, {"circularity", h.score.lenientCircularityWeight}, {"aspect", h.score.lenientAspectWeight}, {"convexity", h.score.lenientConvexityWeight}}},
            {"lenient_contrast_scale", h.score.lenientContrastScale},
            {"weights", {{"darkness", h.score.darknessWeight}, {"neighborhood", h.score.neighborhoodWeight}, {"circularity", h.score.circularityWeight}, {"aspect", h.score.aspectWeight}, {"texture", h.score.textureWeight}}},
            {"min_patch_pixels", h.score.minPatchPixels},
            {"max_mean_intensity", h.score.maxMeanIntensity},
            {"neighborhood_margin", h.score.neighborhoodMargin},
            {"min_contrast_ratio", h.score.minContrastRatio},
            {"contrast_scale", h.score.contrastScale},
            {"min_circularity", h.score.minCircularity},
            {"circularity_scale", h.score.circularityScale},
            {"max_aspect_ratio", h.score.maxAspectRatio},
            {"min_texture_stddev", h.score.minTextureStdDev},
            {"texture_scale", h.score.textureScale}};
        root["heuristic"] = heuristic;

        return root;
    }

} // namespace config
