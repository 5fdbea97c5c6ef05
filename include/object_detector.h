#ifndef OBJECT_DETECTOR_H
#define OBJECT_DETECTOR_H

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "detection_types.h"

enum class DetectorState {
    Uninitialized,
    Initializing,
    Ready,
    Failed
};

const char* detectorStateName(DetectorState state);

/**
 * @brief Base class for pretrained detection models.
 *
 * Owns the load state machine. Subclasses only load their backend and run
 * one inference; everything else (once-only loading, soft failure on bad
 * frames or errors) lives here.
 */
class ObjectDetector {
public:
    ObjectDetector();
    virtual ~ObjectDetector() = default;

    ObjectDetector(const ObjectDetector&) = delete;
    ObjectDetector& operator=(const ObjectDetector&) = delete;

    /**
     * @brief Load the model once.
     *
     * A no-op returning true when already ready. After a failure the next
     * call tries again. Concurrent callers wait for the one in progress.
     * @return True if the detector is ready
     */
    bool initialize();

    bool isReady() const { return state() == DetectorState::Ready; }

    DetectorState state() const { return currentState.load(); }

    /**
     * @brief Error reported by the most recent failed initialization
     */
    std::string lastError() const;

    /**
     * @brief Detect objects in a frame
     * @param frame Input frame (BGR)
     * @return Detections in frame pixel coordinates; empty if the frame has
     *         no area, the model is not loaded, or inference failed
     */
    std::vector<RawDetection> detect(const cv::Mat& frame);

protected:
    /**
     * @brief Load backend resources
     * @throws std::exception on failure
     */
    virtual void loadModel() = 0;

    /**
     * @brief Run one inference on a non-empty frame
     * @throws std::exception on failure
     */
    virtual std::vector<RawDetection> runInference(const cv::Mat& frame) = 0;

private:
    std::atomic<DetectorState> currentState;
    mutable std::mutex initMutex;
    std::string errorMessage;
};

#endif // OBJECT_DETECTOR_H
