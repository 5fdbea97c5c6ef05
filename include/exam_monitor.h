#ifndef EXAM_MONITOR_H
#define EXAM_MONITOR_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include "alert_journal.h"
#include "alert_system.h"
#include "camera_processor.h"
#include "logger.h"
#include "monitor_config.h"
#include "monitoring_session.h"
#include "object_detector.h"
#include "utils.h"

/**
 * @brief Monitoring loop: samples the frame source on a fixed interval,
 *        runs the session, then applies the violation policy, journal and
 *        logging to the alerts it returns.
 */
class ExamMonitor {
public:
    /**
     * @brief Constructor using the TFLite SSD detector from the configuration
     * @param config Validated configuration
     */
    explicit ExamMonitor(const MonitorConfig& config);

    /**
     * @brief Constructor with an explicit detector
     * @param config Validated configuration
     * @param detector Detector to monitor with
     */
    ExamMonitor(const MonitorConfig& config, std::shared_ptr<ObjectDetector> detector);

    /**
     * @brief Destructor
     */
    ~ExamMonitor();

    /**
     * @brief Open the source and monitor until stopped, the stream ends or
     *        the session is terminated
     * @return False if the source could not be opened
     */
    bool run();

    /**
     * @brief One monitoring tick. Initializes the session first if needed.
     * @param frame Sampled frame (may be empty)
     * @param surfaceVisible Whether the monitoring surface is visible
     * @param nowMs Tick time in epoch milliseconds
     * @return False once the session has been terminated
     */
    bool tick(const cv::Mat& frame, bool surfaceVisible, int64_t nowMs);

    void requestStop() { running = false; }

    const AlertSystem& getAlertSystem() const { return alertSystem; }
    const DetectionSnapshot& getLastSnapshot() const { return lastSnapshot; }
    const MonitoringSession& getSession() const { return session; }

private:
    /**
     * @brief Visibility signal: preview window shown and monitoring not paused
     */
    bool isSurfaceVisible() const;

    bool checkDisplayAvailability();

    void printSummary() const;

    MonitorConfig config;
    std::shared_ptr<ObjectDetector> detector;
    MonitoringSession session;
    AlertSystem alertSystem;
    AlertJournal journal;
    Logger logger;
    std::unique_ptr<CameraProcessor> cameraProcessor;
    FPSCounter tickCounter;

    DetectionSnapshot lastSnapshot;
    bool displayAvailable;
    bool paused;
    bool initFailureReported;
    int ticks;
    std::atomic<bool> running;
};

#endif // EXAM_MONITOR_H
