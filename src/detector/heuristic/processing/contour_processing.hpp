#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "roi_processing.hpp"

namespace contour_processing
{

    // Parameters for candidate extraction
    struct ContourParams
    {
        // Adaptive Canny thresholds, relative to median intensity of the smoothed ROI
        double cannyLowerRatio = 0.5;
        double cannyUpperRatio = 1.5;

        // Morphological cleanup
        int morphKernelSize = 3;            // Structuring element size for closing and dilation
        int morphShape = cv::MORPH_ELLIPSE; // Shape of structuring element
        int closeIterations = 2;            // Closing bridges small gaps in pothole rims
        int dilateIterations = 1;           // Connects nearby edge fragments

        // OpenCV contour detection parameters
        int contourMode = cv::RETR_EXTERNAL;         // Outer boundaries only, no nested holes
        int contourMethod = cv::CHAIN_APPROX_SIMPLE; // Compress straight segments

        // Contour filtering, areas relative to ROI area
        double minAreaRatio = 0.003; // 0.3% of ROI
        double maxAreaRatio = 0.15;  // 15% of ROI
        double maxAspectRatio = 5.0; // max(w,h)/min(w,h) of the bounding box
    };

    // A provisional pothole region, ROI pixel space
    struct Candidate
    {
        cv::Rect box;                    // Bounding box in processed-ROI pixels
        std::vector<cv::Point> contour;  // Outer boundary
        double area = 0.0;               // Enclosed contour area
        cv::Mat patch;                   // Pre-enhancement grayscale under the box
    };

    // Check parameter ranges
    bool validateParams(const ContourParams &params);

    // Structuring element for closing/dilation, created once per detector
    cv::Mat createMorphKernel(const ContourParams &params = ContourParams());

    // Median intensity of an 8-bit single-channel image
    int medianIntensity(const cv::Mat &gray);

    // Binary edge mask after adaptive Canny and morphology
    cv::Mat buildEdgeMask(
        const cv::Mat &smoothed,
        const cv::Mat &kernel,
        const ContourParams &params = ContourParams());

    // Main function - preprocessed ROI in, filtered candidates out (discovery order)
    std::vector<Candidate> processContours(
        const roi_processing::PreprocessedFrame &pre,
        const cv::Mat &kernel,
        bool debug_mode = false,
        const ContourParams &params = ContourParams());

} // namespace contour_processing
