#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <sys/stat.h>
#include <opencv2/opencv.hpp>
#include "logging.hpp"

namespace debug
{
    // Root directory for intermediate stage images
    static const std::string DEBUG_DIR = "debug_frames";

    // mkdir -p
    inline bool ensureDirectory(const std::string &path)
    {
        std::string partial;
        size_t pos = 0;
        while (pos != std::string::npos)
        {
            pos = path.find('/', pos + 1);
            partial = path.substr(0, pos);
            if (partial.empty())
                continue;
            if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST)
            {
                log_warning("Cannot create directory " + partial);
                return false;
            }
        }
        return true;
    }

    // Save one stage image to debug_frames/<stage>/<name>.jpg
    inline void saveDebugImage(const std::string &stage, const std::string &name, const cv::Mat &image)
    {
        if (image.empty())
            return;

        std::string dir = DEBUG_DIR + "/" + stage;
        if (!ensureDirectory(dir))
            return;

        std::string path = dir + "/" + name + ".jpg";
        if (!cv::imwrite(path, image))
        {
            log_warning("Failed to write debug image " + path);
        }
    }

    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cerr << "=====================================\n";
        std::cerr << "  " << appName << " v" << version << " starting...\n";
        std::cerr << "=====================================\n";
    }

    inline void printConfig(const std::string &source, const std::string &model, bool heuristicOnly,
                            double fps, double cooldown)
    {
        std::cerr << "Configuration:\n";
        std::cerr << "  - Source: " << source << "\n";
        std::cerr << "  - Model: " << (heuristicOnly ? std::string("(disabled)") : model) << "\n";
        std::cerr << "  - Polling: " << fps << " frames/s\n";
        std::cerr << "  - Alert cooldown: " << cooldown << " s\n";
        std::cerr << "-------------------------------------" << std::endl;
    }

    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "OpenPothole runtime version: " << version << std::endl;
        exit(0);
    }

    inline void printHelpAndExit()
    {
        std::cout << "Usage: openpothole [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --source <src>         Video file, image sequence pattern or camera index (default: 0)\n";
        std::cout << "  --model <path>         ONNX pothole model (default: pothole_detector.onnx)\n";
        std::cout << "  --config <path>        JSON detector configuration\n";
        std::cout << "  --heuristic            Use the heuristic detector only\n";
        std::cout << "  --min-confidence <f>   User-facing confidence cutoff (default: 0.5 model, 0.6 heuristic)\n";
        std::cout << "  --fps <f>              Frames processed per second, 0 = as fast as possible (default: 10)\n";
        std::cout << "  --cooldown <s>         Seconds between pothole alerts (default: 2)\n";
        std::cout << "  --max-frames <n>       Stop after n frames, 0 = no limit (default: 0)\n";
        std::cout << "  --json                 Print one JSON object per frame to stdout\n";
        std::cout << "  --print-config         Print the effective configuration as JSON and exit\n";
        std::cout << "  --log-file <path>      Also write log messages to a file\n";
        std::cout << "  --log-level <level>    error, warning, info or debug (default: warning)\n";
        std::cout << "  --debug, -d            Debug mode (verbose logs, stage images in debug_frames/)\n";
        std::cout << "  --quiet, -q            Quiet mode (only show errors)\n";
        std::cout << "  --version              Show version information\n";
        std::cout << "  --help                 Show this help message\n";
        exit(0);
    }

} // namespace debug
