#ifndef UTILS_H
#define UTILS_H

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <deque>
#include <iomanip>
#include <sstream>
#include <string>
#include "detection_types.h"

/**
 * @brief Milliseconds on the steady clock (for intervals, never for timestamps)
 */
inline int64_t monotonicMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

/**
 * @brief Wall-clock time in milliseconds since the Unix epoch
 */
inline int64_t epochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Format the current local time with a strftime pattern
 */
inline std::string formatLocalTime(const char* pattern) {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tmBuf;
    localtime_r(&time, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, pattern);
    return ss.str();
}

/**
 * @brief FPS counter class to measure ticks per second
 */
class FPSCounter {
public:
    FPSCounter(int avgFrames = 30) : avgFrames(avgFrames) {}

    /**
     * @brief Update the FPS calculation with a new frame
     */
    void update() {
        frameTimes.push_back(std::chrono::steady_clock::now());

        // Keep only the last avgFrames times
        while (frameTimes.size() > static_cast<size_t>(avgFrames)) {
            frameTimes.pop_front();
        }
    }

    /**
     * @brief Get the current FPS
     * @return Current FPS value
     */
    double getFPS() const {
        if (frameTimes.size() <= 1) {
            return 0.0;
        }

        auto timeDiff = std::chrono::duration_cast<std::chrono::microseconds>(
            frameTimes.back() - frameTimes.front()).count() / 1000000.0;

        if (timeDiff <= 0.0) {
            return 0.0;
        }

        return (frameTimes.size() - 1) / timeDiff;
    }

private:
    int avgFrames;
    std::deque<std::chrono::steady_clock::time_point> frameTimes;
};

/**
 * @brief Draw a classified object on a frame
 * @param frame Frame to draw on
 * @param object Object with pixel-space box
 * @return Frame with bounding box drawn
 */
inline cv::Mat drawDetectionBox(cv::Mat& frame, const ClassifiedObject& object) {
    // Devices in red, persons in green (BGR)
    cv::Scalar color = object.kind == ObjectKind::Device ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 255, 0);

    int xmin = static_cast<int>(object.bbox.x);
    int ymin = static_cast<int>(object.bbox.y);
    int xmax = static_cast<int>(object.bbox.x + object.bbox.width);
    int ymax = static_cast<int>(object.bbox.y + object.bbox.height);

    cv::rectangle(frame, cv::Point(xmin, ymin), cv::Point(xmax, ymax), color, 3);

    std::string labelText = std::string(objectKindName(object.kind)) + ": " +
                            std::to_string(object.confidence).substr(0, 4);

    int fontFace = cv::FONT_HERSHEY_SIMPLEX;
    double fontScale = 0.7;
    int thickness = 2;
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(labelText, fontFace, fontScale, thickness, &baseline);

    // Filled background behind the label
    cv::rectangle(frame,
                  cv::Point(xmin, ymin - textSize.height - 10),
                  cv::Point(xmin + textSize.width + 10, ymin),
                  cv::Scalar(0, 0, 0),
                  -1);

    cv::putText(frame, labelText, cv::Point(xmin + 5, ymin - 5),
                fontFace, fontScale, color, thickness);

    return frame;
}

/**
 * @brief Draw all snapshot objects and a one-line status
 */
inline cv::Mat drawSnapshot(cv::Mat& frame, const DetectionSnapshot& snapshot) {
    for (const auto& object : snapshot.objects) {
        drawDetectionBox(frame, object);
    }

    std::string status = "Persons: " + std::to_string(snapshot.personCount) +
                         (snapshot.deviceDetected ? "  Device: yes" : "  Device: no");
    cv::putText(frame, status, cv::Point(10, frame.rows - 15), cv::FONT_HERSHEY_SIMPLEX,
                0.7, cv::Scalar(255, 255, 255), 2);
    return frame;
}

#endif // UTILS_H
