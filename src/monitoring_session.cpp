#include "monitoring_session.h"
#include <stdexcept>

namespace {

ViolationEngineSettings engineSettings(const MonitorConfig& config) {
    ViolationEngineSettings settings;
    settings.allowedPersons = config.allowedPersons;
    settings.windowLength = config.smoothingWindowLength;
    settings.triggerRatio = config.triggerRatio;
    settings.cooldownMs = config.cooldownMs;
    return settings;
}

ObjectDetector& requireDetector(const std::shared_ptr<ObjectDetector>& detector) {
    if (!detector) {
        throw std::invalid_argument("MonitoringSession requires a detector");
    }
    return *detector;
}

bool hasArea(const cv::Mat& frame) {
    return !frame.empty() && frame.cols > 0 && frame.rows > 0;
}

} // namespace

MonitoringSession::MonitoringSession(const MonitorConfig& config,
                                     std::shared_ptr<ObjectDetector> detector,
                                     PredictionCache::Clock cacheClock)
    : detector(detector),
      classifier(config.minPersonScore, config.minDeviceScore, config.deviceClassNames),
      cache(requireDetector(detector), BoxFilter(config.minBoxAreaRatio), config.cacheFreshnessMs, cacheClock),
      engine(engineSettings(config)) {
}

bool MonitoringSession::initialize() {
    if (!detector->initialize()) {
        return false;
    }
    reset();
    return true;
}

std::vector<ViolationAlert> MonitoringSession::analyzeForViolations(const cv::Mat& frame,
                                                                    bool surfaceVisible,
                                                                    int64_t nowMs) {
    // No observation: do not record a synthetic "false" either
    if (!isReady() || !surfaceVisible || !hasArea(frame)) {
        return {};
    }

    std::vector<ClassifiedObject> objects = classifier.classify(cache.getPredictions(frame));
    return engine.update(objects, nowMs);
}

DetectionSnapshot MonitoringSession::detectCurrentState(const cv::Mat& frame) {
    if (!isReady() || !hasArea(frame)) {
        return DetectionSnapshot();
    }
    return Classifier::snapshot(classifier.classify(cache.getPredictions(frame)));
}

void MonitoringSession::reset() {
    engine.reset();
    cache.clear();
}
