#pragma once

#include <opencv2/opencv.hpp>

using namespace cv;

namespace roi_processing
{
    // Road-surface ROI and enhancement parameters
    struct ROIParams
    {
        // ROI placement: potholes appear on the road ahead, in the lower part of the frame
        float roiStartFraction = 0.40f; // ROI starts at 40% of frame height
        int maxProcessingWidth = 640;   // Downscale wider ROIs for latency

        // Contrast enhancement (CLAHE)
        double claheClipLimit = 3.0;
        int claheTileGrid = 8;

        // Edge-preserving smoothing (bilateral keeps pothole rims sharp, Gaussian would not)
        int bilateralDiameter = 5;
        double bilateralSigmaColor = 50.0;
        double bilateralSigmaSpace = 50.0;
    };

    // Enhanced ROI plus the mapping back to full-frame coordinates
    struct PreprocessedFrame
    {
        Mat gray;            // Grayscale ROI before enhancement (used for patch statistics)
        Mat enhanced;        // After CLAHE
        Mat smoothed;        // After bilateral filter (used for edges and neighborhood contrast)
        int roiOffsetY = 0;  // ROI top row in full-frame pixels
        double scale = 1.0;  // Processing scale (ROI pixels * 1/scale = frame pixels)
        Size roiSize;        // ROI size after scaling
        Size frameSize;      // Original frame size
        bool valid = false;  // False for empty or unsupported frames
    };

    // Check parameter ranges, logs the first problem found
    bool validateParams(const ROIParams &params);

    // Create the contrast enhancer once per detector
    Ptr<CLAHE> createEnhancer(const ROIParams &params = ROIParams());

    // Main function: full BGR frame in, enhanced grayscale ROI out
    PreprocessedFrame processROI(
        const Mat &frame,
        const Ptr<CLAHE> &clahe,
        bool debug_mode = false,
        const ROIParams &params = ROIParams());

    // Map a box in processed-ROI pixels to normalized full-frame coordinates, clamped to [0,1]
    Rect2f toFrameCoordinates(const Rect &roiBox, const PreprocessedFrame &pre);

} // namespace roi_processing
