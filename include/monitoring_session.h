#ifndef MONITORING_SESSION_H
#define MONITORING_SESSION_H

#include <cstdint>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include "box_filter.h"
#include "classifier.h"
#include "detection_types.h"
#include "monitor_config.h"
#include "object_detector.h"
#include "prediction_cache.h"
#include "violation_engine.h"

/**
 * @brief State of one monitoring session: prediction cache, classifier and
 *        the per-kind smoothing windows.
 *
 * Ticks must not overlap; the caller drives all calls from one loop.
 * Independent sessions may share a detector but not a loop.
 */
class MonitoringSession {
public:
    /**
     * @brief Constructor
     * @param config Validated configuration
     * @param detector Detector shared with other sessions
     * @param cacheClock Millisecond clock for cache freshness (monotonic by default)
     */
    MonitoringSession(const MonitorConfig& config,
                      std::shared_ptr<ObjectDetector> detector,
                      PredictionCache::Clock cacheClock = PredictionCache::Clock());

    /**
     * @brief Initialize the detector and start from a clean state
     * @return True if the detector is ready
     */
    bool initialize();

    bool isReady() const { return detector->isReady(); }

    /**
     * @brief Alert path for one tick
     * @param frame Current frame
     * @param surfaceVisible Whether the monitoring surface is visible
     * @param nowMs Tick time in epoch milliseconds
     * @return Alerts fired this tick. A hidden surface, an empty frame or a
     *         detector that is not ready yields no alerts and leaves the
     *         windows untouched.
     */
    std::vector<ViolationAlert> analyzeForViolations(const cv::Mat& frame, bool surfaceVisible,
                                                     int64_t nowMs);

    /**
     * @brief Display path: what is visible right now, without rate limiting
     */
    DetectionSnapshot detectCurrentState(const cv::Mat& frame);

    /**
     * @brief Clear both windows, both cooldowns and the cached prediction
     */
    void reset();

    const ViolationEngine& getEngine() const { return engine; }
    const PredictionCache& getCache() const { return cache; }

private:
    std::shared_ptr<ObjectDetector> detector;
    Classifier classifier;
    PredictionCache cache;
    ViolationEngine engine;
};

#endif // MONITORING_SESSION_H
