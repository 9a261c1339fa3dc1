#include "roi_processing.hpp"
#include "utils.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

// ROI = "Region of Interest": the road band in front of the vehicle.
// Cropping it removes sky, horizon and dashboard clutter and cuts processing time.

namespace roi_processing
{
    bool validateParams(const ROIParams &params)
    {
        if (params.roiStartFraction < 0.0f || params.roiStartFraction >= 1.0f)
        {
            log_error("ROI start fraction must be in [0, 1): " + log_string(params.roiStartFraction));
            return false;
        }
        if (params.maxProcessingWidth <= 0)
        {
            log_error("Processing width cap must be positive: " + log_string(params.maxProcessingWidth));
            return false;
        }
        if (params.claheClipLimit <= 0.0 || params.claheTileGrid <= 0)
        {
            log_error("Invalid CLAHE settings");
            return false;
        }
        if (params.bilateralDiameter <= 0)
        {
            log_error("Bilateral diameter must be positive: " + log_string(params.bilateralDiameter));
            return false;
        }
        return true;
    }

    Ptr<CLAHE> createEnhancer(const ROIParams &params)
    {
        return createCLAHE(params.claheClipLimit, Size(params.claheTileGrid, params.claheTileGrid));
    }

    // Grayscale conversion for the channel layouts a camera may hand us
    static bool toGray(const Mat &src, Mat &gray)
    {
        switch (src.channels())
        {
        case 1:
            gray = src.clone();
            return true;
        case 3:
            cvtColor(src, gray, COLOR_BGR2GRAY);
            return true;
        case 4:
            cvtColor(src, gray, COLOR_BGRA2GRAY);
            return true;
        default:
            return false;
        }
    }

    PreprocessedFrame processROI(const Mat &frame, const Ptr<CLAHE> &clahe, bool debug_mode, const ROIParams &params)
    {
        PreprocessedFrame result;

        if (frame.empty() || frame.depth() != CV_8U)
        {
            return result;
        }

        result.frameSize = frame.size();

        // Step 1: Crop the bottom band
        int roiY = int(frame.rows * params.roiStartFraction);
        if (roiY >= frame.rows)
        {
            return result;
        }
        result.roiOffsetY = roiY;
        Mat roi = frame(Rect(0, roiY, frame.cols, frame.rows - roiY));

        // Step 2: Downscale wide ROIs
        if (roi.cols > params.maxProcessingWidth)
        {
            result.scale = double(params.maxProcessingWidth) / roi.cols;
            Mat scaled;
            resize(roi, scaled, Size(), result.scale, result.scale, INTER_AREA);
            roi = scaled;
        }

        if (roi.empty())
        {
            return result;
        }

        // Step 3: Grayscale
        if (!toGray(roi, result.gray))
        {
            log_debug("Unsupported channel count: " + log_string(roi.channels()));
            return result;
        }

        // Step 4: Adaptive contrast enhancement
        clahe->apply(result.gray, result.enhanced);

        // Step 5: Edge-preserving smoothing
        bilateralFilter(result.enhanced, result.smoothed, params.bilateralDiameter,
                        params.bilateralSigmaColor, params.bilateralSigmaSpace);

        result.roiSize = result.gray.size();
        result.valid = true;

        if (debug_mode)
        {
            debug::saveDebugImage("roi_processing", "enhanced", result.enhanced);
            debug::saveDebugImage("roi_processing", "smoothed", result.smoothed);
        }

        return result;
    }

    Rect2f toFrameCoordinates(const Rect &roiBox, const PreprocessedFrame &pre)
    {
        if (pre.frameSize.width <= 0 || pre.frameSize.height <= 0 || pre.scale <= 0.0)
            return Rect2f();

        float frameW = float(pre.frameSize.width);
        float frameH = float(pre.frameSize.height);

        float x = float(roiBox.x / pre.scale) / frameW;
        float y = float(roiBox.y / pre.scale + pre.roiOffsetY) / frameH;
        float w = float(roiBox.width / pre.scale) / frameW;
        float h = float(roiBox.height / pre.scale) / frameH;

        x = std::min(std::max(x, 0.0f), 1.0f);
        y = std::min(std::max(y, 0.0f), 1.0f);
        w = std::min(std::max(w, 0.0f), 1.0f - x);
        h = std::min(std::max(h, 0.0f), 1.0f - y);

        return Rect2f(x, y, w, h);
    }

} // namespace roi_processing
