#pragma once
#include "detector_interface.hpp"
#include "detector_config.hpp"
#include "heuristic/heuristic_detector.hpp"
#include "model/model_detector.hpp"
#include "utils.hpp"
#include <memory>
#include <string>

// Which detector the facade is running, chosen once at construction
enum class DetectorMode
{
    MODEL_ACTIVE,
    HEURISTIC_ACTIVE,
    INACTIVE
};

inline std::string detectorModeName(DetectorMode mode)
{
    switch (mode)
    {
    case DetectorMode::MODEL_ACTIVE:
        return "MODEL_ACTIVE";
    case DetectorMode::HEURISTIC_ACTIVE:
        return "HEURISTIC_ACTIVE";
    case DetectorMode::INACTIVE:
        return "INACTIVE";
    default:
        return "UNKNOWN";
    }
}

struct DetectorSelection
{
    std::unique_ptr<DetectorInterface> detector; // Null when INACTIVE
    DetectorMode mode = DetectorMode::INACTIVE;
};

class DetectorFactory
{
private:
    // Model is usable only if a file exists on the search path and loads
    static std::unique_ptr<DetectorInterface> tryModelDetector(const DetectorConfig &config, bool debug_mode)
    {
        auto detector = std::make_unique<ModelDetector>(config.model, config.heuristic, debug_mode);
        if (!detector->initialize())
        {
            return nullptr;
        }
        return detector;
    }

    static std::unique_ptr<DetectorInterface> tryHeuristicDetector(const DetectorConfig &config, bool debug_mode)
    {
        auto detector = std::make_unique<HeuristicDetector>(config.heuristic, debug_mode);
        if (!detector->initialize())
        {
            return nullptr;
        }
        return detector;
    }

public:
    static DetectorSelection createDetector(const DetectorConfig &config, bool debug_mode = false)
    {
        DetectorSelection selection;

        if (config.heuristicOnly)
        {
            log_info("Heuristic-only mode requested, skipping model");
        }
        else
        {
            log_debug("Probing for pothole model: " + config.model.modelPath);
            selection.detector = tryModelDetector(config, debug_mode);
            if (selection.detector)
            {
                log_info("Using model detector (high precision)");
                selection.mode = DetectorMode::MODEL_ACTIVE;
                return selection;
            }
            log_warning("Model not available, falling back to heuristic detector");
        }

        selection.detector = tryHeuristicDetector(config, debug_mode);
        if (selection.detector)
        {
            log_warning("Using heuristic detector (lower precision, more false positives)");
            selection.mode = DetectorMode::HEURISTIC_ACTIVE;
            return selection;
        }

        log_error("No detector could be initialized, detection disabled");
        selection.mode = DetectorMode::INACTIVE;
        return selection;
    }
};
