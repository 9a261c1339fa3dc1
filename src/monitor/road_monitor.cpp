#include "road_monitor.hpp"
#include "utils.hpp"
#include "utils/camera.hpp"
#include <iostream>
#include <thread>
#include <chrono>

using namespace std;
using namespace cv;
using json = nlohmann::json;

json frameReport(int frame_index, const DetectionList &detections, bool alert, const AlertGate &gate)
{
    json report;
    report["frame"] = frame_index;
    report["alert"] = alert;
    report["total_detections"] = gate.getTotalDetections();

    json boxes = json::array();
    for (const auto &d : detections)
    {
        boxes.push_back({{"x", d.x}, {"y", d.y}, {"w", d.w}, {"h", d.h}, {"confidence", d.confidence}});
    }
    report["detections"] = boxes;
    return report;
}

RoadMonitor::RoadMonitor(const MonitorOptions &options, const DetectorConfig &config, bool debug_mode)
    : options(options), detector(config, debug_mode), gate(options.cooldown)
{
}

RoadMonitor::~RoadMonitor()
{
    stop();
}

void RoadMonitor::stop()
{
    running = false;
}

void RoadMonitor::report(const DetectionList &detections, bool alert)
{
    if (options.json_output)
    {
        json line = frameReport(frame_count, detections, alert, gate);
        line["mode"] = detectorModeName(detector.getMode());
        cout << line.dump() << endl;
        return;
    }

    if (alert)
    {
        log_warning("POTHOLE DETECTED | Frame " + to_string(frame_count) +
                    " | Count: " + to_string(detections.size()) +
                    " | Avg confidence: " + to_string(int(gate.getLastAverageConfidence() * 100)) + "%" +
                    " | Total: " + to_string(gate.getTotalDetections()));
    }
    else if (!detections.empty())
    {
        log_debug("Frame " + to_string(frame_count) + ": " + to_string(detections.size()) + " detections (alert cooling down)");
    }
}

DetectionList RoadMonitor::processFrame(const Mat &frame, AlertGate::Clock::time_point now)
{
    frame_count++;
    DetectionList detections = detector.detect(frame);
    bool alert = gate.update(detections, now);
    report(detections, alert);
    return detections;
}

bool RoadMonitor::run()
{
    VideoCapture cap;
    if (!camera::openSource(cap, options.source))
    {
        return false;
    }

    bool live = camera::isDeviceIndex(options.source);
    auto interval = options.fps > 0.0
                        ? chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(1.0 / options.fps))
                        : chrono::steady_clock::duration::zero();

    running = true;
    log_info("Monitoring " + options.source + " with " + detector.getDetectorName() + " detector");

    int read_failures = 0;
    auto next_tick = chrono::steady_clock::now();

    while (running)
    {
        Mat frame;
        if (!cap.read(frame) || frame.empty())
        {
            read_failures++;
            if (!live || read_failures >= options.max_read_failures)
            {
                if (live)
                    log_error("Frame source stopped delivering frames after " + to_string(read_failures) + " attempts");
                break;
            }
            continue;
        }
        read_failures = 0;

        processFrame(frame, chrono::steady_clock::now());

        if (options.max_frames > 0 && frame_count >= options.max_frames)
            break;

        // Fixed cadence, no backlog: a slow frame pushes the schedule instead of queueing
        if (interval > chrono::steady_clock::duration::zero())
        {
            next_tick += interval;
            auto now = chrono::steady_clock::now();
            if (next_tick > now)
                this_thread::sleep_until(next_tick);
            else
                next_tick = now;
        }
    }

    running = false;
    log_info("Monitor stopped after " + to_string(frame_count) + " frames, " +
             to_string(gate.getAlertCount()) + " alerts, " +
             to_string(gate.getTotalDetections()) + " potholes reported");
    return true;
}
