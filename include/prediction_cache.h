#ifndef PREDICTION_CACHE_H
#define PREDICTION_CACHE_H

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "box_filter.h"
#include "detection_types.h"
#include "object_detector.h"

struct PredictionCacheEntry {
    int64_t capturedAtMs = 0;
    std::vector<RawDetection> predictions;
};

/**
 * @brief Reuses the last filtered inference result for a short time.
 *
 * The alert path and the display path both ask for predictions in the same
 * tick; the second request is served from here. Not thread-safe: one
 * monitoring loop owns it.
 */
class PredictionCache {
public:
    using Clock = std::function<int64_t()>;

    /**
     * @brief Constructor
     * @param detector Detector invoked on a miss (must outlive the cache)
     * @param boxFilter Filter applied before storing
     * @param freshnessMs Entries younger than this are reused; 0 disables reuse
     * @param clock Millisecond clock, monotonic by default
     */
    PredictionCache(ObjectDetector& detector, const BoxFilter& boxFilter,
                    int64_t freshnessMs, Clock clock = Clock());

    /**
     * @brief Filtered predictions for the frame, fresh or cached.
     * @return Empty, without touching the cache, if the detector is not
     *         ready or the frame has no area
     */
    std::vector<RawDetection> getPredictions(const cv::Mat& frame);

    void clear();

    bool hasEntry() const { return entry.has_value(); }

    // Number of detector invocations since construction
    uint64_t getInferenceCount() const { return inferenceCount; }

private:
    ObjectDetector& detector;
    BoxFilter boxFilter;
    int64_t freshnessMs;
    Clock clock;
    std::optional<PredictionCacheEntry> entry;
    uint64_t inferenceCount;
};

#endif // PREDICTION_CACHE_H
