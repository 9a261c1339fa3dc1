#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace camera
{
    // Determine if a given path is a video file based on its extension
    inline bool isVideoFile(const string &path)
    {
        string lower_path = path;
        transform(lower_path.begin(), lower_path.end(), lower_path.begin(), ::tolower);

        const vector<string> video_extensions = {".mp4", ".avi", ".mkv", ".mov", ".wmv"};
        for (const auto &ext : video_extensions)
        {
            if (lower_path.length() >= ext.length() &&
                lower_path.substr(lower_path.length() - ext.length()) == ext)
            {
                return true;
            }
        }
        return false;
    }

    // "0", "1", ... select a capture device
    inline bool isDeviceIndex(const string &source)
    {
        return !source.empty() && all_of(source.begin(), source.end(), [](unsigned char c)
                                         { return isdigit(c) != 0; });
    }

    // Open a frame source: device index, video file or image sequence pattern (road_%04d.jpg)
    inline bool openSource(VideoCapture &cap, const string &source)
    {
        if (isDeviceIndex(source))
        {
            int index = 0;
            try
            {
                index = stoi(source);
            }
            catch (const out_of_range &)
            {
                log_error("Capture device index out of range: " + source);
                return false;
            }
            log_debug("Opening capture device " + source);
            cap.open(index);
        }
        else
        {
            log_debug((isVideoFile(source) ? "Opening video file " : "Opening image source ") + source);
            cap.open(source);
        }

        if (!cap.isOpened())
        {
            log_error("Cannot open frame source: " + source);
            return false;
        }

        log_info("Opened " + source + " (" + to_string((int)cap.get(CAP_PROP_FRAME_WIDTH)) + "x" +
                 to_string((int)cap.get(CAP_PROP_FRAME_HEIGHT)) + ")");
        return true;
    }

} // namespace camera
