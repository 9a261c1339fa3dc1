#pragma once
#include "heuristic/heuristic_detector.hpp"
#include "model/model_processing.hpp"

// Everything needed to build a PotholeDetector
struct DetectorConfig
{
    // User-facing cutoffs applied by the facade after the detector's own internal threshold
    float modelMinConfidence = 0.50f;
    float heuristicMinConfidence = 0.60f; // Stricter, the heuristic has more false positives

    bool heuristicOnly = false; // Skip model probing

    model_processing::ModelParams model;
    HeuristicParams heuristic;
};
