#pragma once
#include <atomic>
#include <string>
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include "detector/pothole_detector.hpp"
#include "alert_gate.hpp"

struct MonitorOptions
{
    std::string source = "0";  // Device index, video file or image sequence pattern
    double fps = 10.0;         // Polling cadence, 0 = as fast as frames arrive
    double cooldown = 2.0;     // Seconds between alerts
    int max_frames = 0;        // 0 = until the source ends
    int max_read_failures = 30; // Consecutive failed reads tolerated on live devices
    bool json_output = false;  // One JSON object per frame on stdout
};

// One report line per processed frame
nlohmann::json frameReport(int frame_index, const DetectionList &detections, bool alert, const AlertGate &gate);

// Polls a frame source at a fixed cadence and feeds the pothole detector
class RoadMonitor
{
public:
    RoadMonitor(const MonitorOptions &options, const DetectorConfig &config, bool debug_mode = false);
    ~RoadMonitor();

    // Blocks until the source ends, max_frames is reached or stop() is called.
    // Returns false if the source could not be opened.
    bool run();
    void stop();

    // Detect on a single frame and report it (used by run())
    DetectionList processFrame(const cv::Mat &frame, AlertGate::Clock::time_point now);

    PotholeDetector &getDetector() { return detector; }
    const AlertGate &getAlertGate() const { return gate; }
    int getFrameCount() const { return frame_count; }

private:
    void report(const DetectionList &detections, bool alert);

    MonitorOptions options;
    PotholeDetector detector;
    AlertGate gate;
    int frame_count = 0;
    std::atomic<bool> running{false};
};
