#include "prediction_cache.h"
#include "utils.h"

PredictionCache::PredictionCache(ObjectDetector& detector, const BoxFilter& boxFilter,
                                 int64_t freshnessMs, Clock clock)
    : detector(detector), boxFilter(boxFilter), freshnessMs(freshnessMs),
      clock(clock ? clock : Clock(monotonicMillis)), inferenceCount(0) {
}

std::vector<RawDetection> PredictionCache::getPredictions(const cv::Mat& frame) {
    if (!detector.isReady() || frame.empty() || frame.cols <= 0 || frame.rows <= 0) {
        return {};
    }

    const int64_t now = clock();
    if (entry && now - entry->capturedAtMs < freshnessMs) {
        return entry->predictions;
    }

    std::vector<RawDetection> raw = detector.detect(frame);
    inferenceCount++;

    PredictionCacheEntry fresh;
    fresh.capturedAtMs = now;
    fresh.predictions = boxFilter.filter(frame.cols, frame.rows, raw);
    entry = std::move(fresh);
    return entry->predictions;
}

void PredictionCache::clear() {
    entry.reset();
}
