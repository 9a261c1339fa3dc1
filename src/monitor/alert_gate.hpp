#pragma once

#include <chrono>
#include <optional>
#include "detector/detection.hpp"

// Cooldown-gated pothole alert. Fires at most once per cooldown window
// and counts the potholes reported by the frames that fired.
class AlertGate
{
public:
    using Clock = std::chrono::steady_clock;

    explicit AlertGate(double cooldown_seconds = 2.0)
        : cooldown(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cooldown_seconds)))
    {
    }

    // True when this frame raises an alert
    bool update(const DetectionList &detections, Clock::time_point now)
    {
        if (detections.empty())
            return false;

        if (last_alert && now - *last_alert < cooldown)
            return false;

        last_alert = now;
        alert_count++;
        total_detections += (int)detections.size();

        float sum = 0.0f;
        for (const auto &detection : detections)
            sum += detection.confidence;
        last_average_confidence = sum / detections.size();
        return true;
    }

    int getAlertCount() const { return alert_count; }
    int getTotalDetections() const { return total_detections; }
    float getLastAverageConfidence() const { return last_average_confidence; }

private:
    Clock::duration cooldown;
    std::optional<Clock::time_point> last_alert;
    int alert_count = 0;
    int total_detections = 0;
    float last_average_confidence = 0.0f;
};
