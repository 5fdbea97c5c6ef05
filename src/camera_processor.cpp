#include "camera_processor.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

CameraProcessor::CameraProcessor(int cameraId)
    : cameraId(cameraId), frameWidth(0), frameHeight(0), fps(0), isLiveCamera(true),
      running(false), totalFrames(0) {
}

CameraProcessor::~CameraProcessor() {
    stop();
}

bool CameraProcessor::openCamera(const std::string& source) {
    try {
        // If source is a digit string, convert to int for webcam
        isLiveCamera = !source.empty() && std::all_of(source.begin(), source.end(),
                                                            [](unsigned char c) { return std::isdigit(c) != 0; });
        if (isLiveCamera) {
            cap.open(std::stoi(source));
        } else {
            cap.open(source);
        }

        if (!cap.isOpened()) {
            std::cerr << "Could not open video source: " << source << std::endl;
            return false;
        }

        if (isLiveCamera) {
            bool resWidthSet = cap.set(cv::CAP_PROP_FRAME_WIDTH, 1280);
            bool resHeightSet = cap.set(cv::CAP_PROP_FRAME_HEIGHT, 720);
            if (!resWidthSet || !resHeightSet) {
                std::cout << "Warning: Camera " << cameraId << " failed to set desired resolution." << std::endl;
            }
        }

        frameWidth = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
        frameHeight = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
        fps = cap.get(cv::CAP_PROP_FPS);

        // If FPS is not available, use default
        if (fps <= 0) {
            fps = 30.0;
        }

        std::cout << "Camera " << cameraId << " opened: " << frameWidth << "x" << frameHeight
                  << " @ " << fps << " FPS" << std::endl;

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error opening camera " << cameraId << ": " << e.what() << std::endl;
        return false;
    }
}

bool CameraProcessor::start() {
    if (!cap.isOpened()) {
        std::cerr << "Camera " << cameraId << " not opened" << std::endl;
        return false;
    }

    running = true;
    captureThread = std::thread(&CameraProcessor::captureFrames, this);
    return true;
}

void CameraProcessor::stop() {
    running = false;

    if (captureThread.joinable()) {
        captureThread.join();
    }

    if (cap.isOpened()) {
        cap.release();
    }
}

void CameraProcessor::captureFrames() {
    // Video files are read at their native frame rate
    const auto framePeriod = std::chrono::microseconds(static_cast<int64_t>(1000000.0 / fps));

    while (running) {
        auto start = std::chrono::steady_clock::now();

        cv::Mat frame;
        bool ret = cap.read(frame);

        if (!ret || frame.empty()) {
            std::cerr << "Camera " << cameraId << ": End of video stream" << std::endl;
            running = false;
            break;
        }

        frameWidth = frame.cols;
        frameHeight = frame.rows;
        {
            std::lock_guard<std::mutex> lock(lastFrameMutex);
            lastFrame = frame;
        }
        totalFrames++;

        if (!isLiveCamera) {
            std::this_thread::sleep_until(start + framePeriod);
        } else {
            // Short sleep to prevent CPU hogging
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

cv::Mat CameraProcessor::getFrame() const {
    std::lock_guard<std::mutex> lock(lastFrameMutex);
    return lastFrame.clone();
}
