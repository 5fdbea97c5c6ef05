#include "box_filter.h"

BoxFilter::BoxFilter(double minBoxAreaRatio)
    : minBoxAreaRatio(minBoxAreaRatio) {
}

std::vector<RawDetection> BoxFilter::filter(int frameWidth, int frameHeight,
                                            const std::vector<RawDetection>& detections) const {
    std::vector<RawDetection> kept;
    if (frameWidth <= 0 || frameHeight <= 0) {
        return kept;
    }

    const double frameArea = static_cast<double>(frameWidth) * frameHeight;
    for (const auto& detection : detections) {
        const double boxArea = static_cast<double>(detection.bbox.width) * detection.bbox.height;
        if (boxArea / frameArea >= minBoxAreaRatio) {
            kept.push_back(detection);
        }
    }
    return kept;
}
