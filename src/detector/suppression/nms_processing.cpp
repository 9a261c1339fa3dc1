#include "nms_processing.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

namespace nms_processing
{
    float computeIoU(const Rect2f &a, const Rect2f &b)
    {
        float x1 = max(a.x, b.x);
        float y1 = max(a.y, b.y);
        float x2 = min(a.x + a.width, b.x + b.width);
        float y2 = min(a.y + a.height, b.y + b.height);

        if (x2 <= x1 || y2 <= y1)
            return 0.0f;

        float intersection = (x2 - x1) * (y2 - y1);
        float unionArea = a.width * a.height + b.width * b.height - intersection;

        return unionArea > 0.0f ? intersection / unionArea : 0.0f;
    }

    DetectionList suppress(const DetectionList &detections, const NmsParams &params)
    {
        DetectionList sorted = detections;
        stable_sort(sorted.begin(), sorted.end(), [](const Detection &a, const Detection &b)
                    { return a.confidence > b.confidence; });

        DetectionList kept;
        vector<char> suppressed(sorted.size(), 0);

        for (size_t i = 0; i < sorted.size(); i++)
        {
            if (suppressed[i])
                continue;

            kept.push_back(sorted[i]);
            if (params.maxDetections > 0 && (int)kept.size() >= params.maxDetections)
                break;

            Rect2f best = sorted[i].box();
            for (size_t j = i + 1; j < sorted.size(); j++)
            {
                if (!suppressed[j] && computeIoU(best, sorted[j].box()) >= params.iouThreshold)
                    suppressed[j] = 1;
            }
        }

        return kept;
    }

} // namespace nms_processing
