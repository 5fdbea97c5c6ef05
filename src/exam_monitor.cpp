#include "exam_monitor.h"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <opencv2/highgui.hpp>
#include "ssd_detector.h"

namespace {

const char* const kWindowName = "Exam Monitor";

// Global flag for signal handling
std::atomic<bool> g_running(true);

void signalHandler(int) {
    g_running = false;
}

} // namespace

ExamMonitor::ExamMonitor(const MonitorConfig& config)
    : ExamMonitor(config, std::make_shared<SsdDetector>(config.modelPath, config.labelsPath,
                                                        config.detectorMinScore, config.maxDetections,
                                                        config.forceCPU)) {
}

ExamMonitor::ExamMonitor(const MonitorConfig& config, std::shared_ptr<ObjectDetector> detector)
    : config(config), detector(detector), session(config, detector),
      alertSystem(config.maxViolations), journal(config.journalPath), logger(config.logDir),
      displayAvailable(false), paused(false), initFailureReported(false), ticks(0), running(false) {
    alertSystem.addNotifier(std::make_shared<ConsoleNotifier>());
}

ExamMonitor::~ExamMonitor() {
    if (cameraProcessor) {
        cameraProcessor->stop();
    }
}

bool ExamMonitor::tick(const cv::Mat& frame, bool surfaceVisible, int64_t nowMs) {
    auto start = std::chrono::steady_clock::now();

    if (alertSystem.isTerminated()) {
        return false;
    }

    // Retries are driven by the loop: a failed load is attempted again next tick
    if (!session.isReady()) {
        if (session.initialize()) {
            logger.logEvent("AI monitoring active: person and device detection enabled");
            if (auto ssd = std::dynamic_pointer_cast<SsdDetector>(detector)) {
                logger.logEvent(std::string("Detector running on ") + (ssd->isUsingTPU() ? "Edge TPU" : "CPU") +
                                ", input " + std::to_string(ssd->getInputWidth()) + "x" +
                                std::to_string(ssd->getInputHeight()));
            }
            initFailureReported = false;
        } else if (!initFailureReported) {
            logger.logEvent(std::string("AI monitoring ") + detectorStateName(detector->state()) +
                            ": " + detector->lastError());
            initFailureReported = true;
        }
    }

    std::vector<ViolationAlert> alerts = session.analyzeForViolations(frame, surfaceVisible, nowMs);
    for (const auto& decision : alertSystem.process(alerts)) {
        logger.logAlert(decision.alert, decision.violationCount, alertSystem.getMaxViolations());
        if (!journal.append(decision)) {
            logger.logEvent("Could not record alert in " + journal.getPath());
        }
    }

    // Served from the prediction cache when the alert path just ran
    lastSnapshot = session.detectCurrentState(frame);
    logger.logSnapshot(lastSnapshot);

    ticks++;
    tickCounter.update();
    double processingTime = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    logger.logPerformance(tickCounter.getFPS(), processingTime);

    if (alertSystem.isTerminated()) {
        logger.logEvent("Session terminated - Maximum AI violations exceeded");
        return false;
    }
    return true;
}

bool ExamMonitor::isSurfaceVisible() const {
    if (paused) {
        return false;
    }
    if (!displayAvailable) {
        return true;
    }
    try {
        return cv::getWindowProperty(kWindowName, cv::WND_PROP_VISIBLE) > 0;
    } catch (const cv::Exception& e) {
        std::cerr << "Error reading window state: " << e.what() << std::endl;
        return false;
    }
}

bool ExamMonitor::checkDisplayAvailability() {
    try {
        cv::namedWindow(kWindowName, cv::WINDOW_AUTOSIZE);
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "Display not available: " << e.what() << std::endl;
        return false;
    }
}

bool ExamMonitor::run() {
    signal(SIGINT, signalHandler);
    g_running = true;

    cameraProcessor = std::make_unique<CameraProcessor>(0);
    if (!cameraProcessor->openCamera(config.source)) {
        logger.logEvent("Failed to open camera/video source: " + config.source);
        return false;
    }
    if (!cameraProcessor->start()) {
        logger.logEvent("Failed to start frame capture");
        return false;
    }

    displayAvailable = config.display && checkDisplayAvailability();
    if (config.display && !displayAvailable) {
        std::cout << "Display requested but not available. Running without display." << std::endl;
    }

    logger.logEvent("Camera " + std::to_string(cameraProcessor->getCameraId()) + " source " + config.source +
                    ": " + std::to_string(cameraProcessor->getFrameWidth()) + "x" +
                    std::to_string(cameraProcessor->getFrameHeight()) + " @ " +
                    std::to_string(static_cast<int>(cameraProcessor->getFPS())) + " FPS");
    logger.logEvent("Monitoring " + config.source + " every " +
                    std::to_string(config.monitorIntervalMs) + "ms, log: " + logger.getLogFile());

    running = true;
    int64_t nextTickAt = monotonicMillis();  // first tick immediately

    while (running && g_running && cameraProcessor->isRunning()) {
        cv::Mat frame = cameraProcessor->getFrame();

        // Ticks run inline and never overlap; a slow inference delays the next one
        if (monotonicMillis() >= nextTickAt) {
            if (!tick(frame, isSurfaceVisible(), epochMillis())) {
                running = false;
            }
            nextTickAt = monotonicMillis() + config.monitorIntervalMs;
        }

        if (displayAvailable) {
            if (!frame.empty()) {
                drawSnapshot(frame, lastSnapshot);
                std::string statusText = paused ? "PAUSED" :
                    "Violations: " + std::to_string(alertSystem.getViolationCount()) + "/" +
                    std::to_string(alertSystem.getMaxViolations());
                cv::putText(frame, statusText, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1.0,
                            cv::Scalar(0, 255, 0), 2);
                try {
                    cv::imshow(kWindowName, frame);
                } catch (const cv::Exception& e) {
                    std::cerr << "Error displaying frame: " << e.what() << std::endl;
                    displayAvailable = false;
                }
            }

            int key = cv::waitKey(30);
            if (key == 27 || key == 'q') {
                running = false;
            } else if (key == 'p') {
                paused = !paused;
                logger.logEvent(paused ? "Monitoring paused" : "Monitoring resumed");
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    cameraProcessor->stop();
    if (displayAvailable) {
        cv::destroyAllWindows();
    }

    printSummary();
    return true;
}

void ExamMonitor::printSummary() const {
    std::cout << "Monitoring finished after " << ticks << " ticks";
    if (cameraProcessor) {
        std::cout << " over " << cameraProcessor->getTotalFrames() << " captured frames";
    }
    std::cout << "." << std::endl;
    std::cout << "Violations: " << alertSystem.getViolationCount() << "/"
              << alertSystem.getMaxViolations()
              << (alertSystem.isTerminated() ? " (session terminated)" : "") << std::endl;
    for (const auto& alert : alertSystem.getAlertLog()) {
        std::cout << "  [" << alert.timestampMs << "] " << violationKindName(alert.kind)
                  << ": " << alert.message << std::endl;
    }
}
