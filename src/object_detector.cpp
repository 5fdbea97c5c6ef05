#include "object_detector.h"
#include <iostream>

const char* detectorStateName(DetectorState state) {
    switch (state) {
        case DetectorState::Initializing: return "initializing";
        case DetectorState::Ready: return "ready";
        case DetectorState::Failed: return "failed";
        default: return "uninitialized";
    }
}

ObjectDetector::ObjectDetector()
    : currentState(DetectorState::Uninitialized) {
}

bool ObjectDetector::initialize() {
    std::lock_guard<std::mutex> lock(initMutex);
    if (currentState == DetectorState::Ready) {
        return true;
    }

    currentState = DetectorState::Initializing;
    try {
        loadModel();
        errorMessage.clear();
        currentState = DetectorState::Ready;
        return true;
    } catch (const std::exception& e) {
        errorMessage = e.what();
        std::cerr << "Detector initialization failed: " << errorMessage << std::endl;
    }

    currentState = DetectorState::Failed;
    return false;
}

std::string ObjectDetector::lastError() const {
    std::lock_guard<std::mutex> lock(initMutex);
    return errorMessage;
}

std::vector<RawDetection> ObjectDetector::detect(const cv::Mat& frame) {
    if (!isReady() || frame.empty() || frame.cols <= 0 || frame.rows <= 0) {
        return {};
    }

    try {
        return runInference(frame);
    } catch (const std::exception& e) {
        std::cerr << "Inference failed: " << e.what() << std::endl;
    }
    return {};
}
