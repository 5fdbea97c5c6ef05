#include "ssd_detector.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

#ifndef DISABLE_TENSORFLOW
#include <tensorflow/lite/kernels/register.h>
#endif

SsdDetector::SsdDetector(const std::string& modelPath,
                         const std::string& labelsPath,
                         float minScore,
                         int maxDetections,
                         bool forceCPU)
    : modelPath(modelPath), labelsPath(labelsPath), minScore(minScore),
      maxDetections(maxDetections), forceCPU(forceCPU),
      inputHeight(300), inputWidth(300), inputChannels(3), useTPU(false) {
}

SsdDetector::~SsdDetector() {
    // Interpreter is released before the Edge TPU context (member order)
}

#ifndef DISABLE_TENSORFLOW
void SsdDetector::loadModel() {
    std::cout << "Loading model from " << modelPath << std::endl;

    model = tflite::FlatBufferModel::BuildFromFile(modelPath.c_str());
    if (!model) {
        throw std::runtime_error("Failed to load model: " + modelPath);
    }

    tflite::ops::builtin::BuiltinOpResolver resolver;
    std::unique_ptr<tflite::Interpreter> newInterpreter;
    tflite::InterpreterBuilder builder(*model, resolver);
    if (builder(&newInterpreter) != kTfLiteOk || !newInterpreter) {
        throw std::runtime_error("Failed to build interpreter");
    }

    // Try to use Edge TPU if not forced to CPU
    useTPU = false;
    if (!forceCPU && modelPath.find("edgetpu") != std::string::npos) {
        try {
            std::cout << "Attempting to use Edge TPU" << std::endl;
            edgetpuContext = edgetpu::EdgeTpuManager::GetSingleton()->OpenDevice();
            if (edgetpuContext) {
                newInterpreter->SetExternalContext(kTfLiteEdgeTpuContext, edgetpuContext.get());
                newInterpreter->SetNumThreads(1);  // Edge TPU doesn't benefit from multiple threads
                useTPU = true;
            } else {
                std::cout << "Edge TPU not available" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cout << "Edge TPU error: " << e.what() << std::endl;
            std::cout << "Falling back to CPU" << std::endl;
        }
    }

    if (newInterpreter->AllocateTensors() != kTfLiteOk) {
        throw std::runtime_error("Failed to allocate tensors");
    }

    auto* inputTensor = newInterpreter->input_tensor(0);
    if (!inputTensor || inputTensor->dims->size != 4) {
        throw std::runtime_error("Unexpected input tensor shape");
    }
    if (inputTensor->type != kTfLiteUInt8) {
        throw std::runtime_error("Only quantized (uint8) SSD models are supported");
    }
    inputHeight = inputTensor->dims->data[1];
    inputWidth = inputTensor->dims->data[2];
    inputChannels = inputTensor->dims->data[3];

    if (newInterpreter->outputs().size() < 4) {
        throw std::runtime_error("Model is not an SSD post-processed detector (expected 4 outputs)");
    }

    std::cout << "Model input dimensions: " << inputWidth << "x" << inputHeight
              << "x" << inputChannels << std::endl;

    if (!loadLabels(labelsPath)) {
        std::cout << "Warning: Failed to load labels from " << labelsPath << std::endl;
    }

    interpreter = std::move(newInterpreter);

    std::cout << "Model loaded successfully. Using "
              << (useTPU ? "Edge TPU" : "CPU") << std::endl;
}

std::vector<RawDetection> SsdDetector::runInference(const cv::Mat& frame) {
    if (!interpreter) {
        throw std::runtime_error("Interpreter not available");
    }

    int origHeight = frame.rows;
    int origWidth = frame.cols;

    cv::Mat resizedFrame;
    cv::resize(frame, resizedFrame, cv::Size(inputWidth, inputHeight));

    cv::Mat rgbFrame;
    if (resizedFrame.channels() == 3 && inputChannels == 3) {
        cv::cvtColor(resizedFrame, rgbFrame, cv::COLOR_BGR2RGB);
    } else if (resizedFrame.channels() == 4 && inputChannels == 3) {
        cv::cvtColor(resizedFrame, rgbFrame, cv::COLOR_BGRA2RGB);
    } else if (resizedFrame.channels() == 1 && inputChannels == 1) {
        rgbFrame = resizedFrame;
    } else {
        throw std::runtime_error("Channel mismatch between input frame and model");
    }
    if (!rgbFrame.isContinuous()) {
        rgbFrame = rgbFrame.clone();
    }

    uint8_t* inputTensorData = interpreter->typed_input_tensor<uint8_t>(0);
    if (!inputTensorData) {
        throw std::runtime_error("Failed to get input tensor data");
    }
    std::memcpy(inputTensorData, rgbFrame.data, inputWidth * inputHeight * inputChannels);

    if (interpreter->Invoke() != kTfLiteOk) {
        throw std::runtime_error("Failed to invoke interpreter");
    }

    // SSD post-process outputs: boxes, classes, scores, count
    const float* outputLocations = interpreter->typed_output_tensor<float>(0);
    const float* outputClasses = interpreter->typed_output_tensor<float>(1);
    const float* outputScores = interpreter->typed_output_tensor<float>(2);
    const float* numDetections = interpreter->typed_output_tensor<float>(3);

    if (!outputLocations || !outputClasses || !outputScores || !numDetections) {
        throw std::runtime_error("Failed to get output tensors");
    }

    int numDetected = static_cast<int>(*numDetections);
    std::vector<RawDetection> detections;

    for (int i = 0; i < numDetected && static_cast<int>(detections.size()) < maxDetections; i++) {
        float score = outputScores[i];
        if (score < minScore) {
            continue;
        }

        // [ymin, xmin, ymax, xmax], normalized
        float ymin = std::max(0.0f, outputLocations[i * 4 + 0]);
        float xmin = std::max(0.0f, outputLocations[i * 4 + 1]);
        float ymax = std::min(1.0f, outputLocations[i * 4 + 2]);
        float xmax = std::min(1.0f, outputLocations[i * 4 + 3]);

        RawDetection detection;
        detection.bbox = BBox(xmin * origWidth,
                              ymin * origHeight,
                              std::max(0.0f, xmax - xmin) * origWidth,
                              std::max(0.0f, ymax - ymin) * origHeight);
        detection.label = getLabel(static_cast<int>(outputClasses[i]));
        detection.score = score;
        detections.push_back(detection);
    }

    return detections;
}
#else
void SsdDetector::loadModel() {
    throw std::runtime_error("Built without TensorFlow Lite support (DISABLE_TENSORFLOW)");
}

std::vector<RawDetection> SsdDetector::runInference(const cv::Mat&) {
    return {};
}
#endif

bool SsdDetector::loadLabels(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open labels file: " << path << std::endl;
        return false;
    }

    labels.clear();
    std::string line;
    int lineNum = 0;
    while (std::getline(file, line)) {
        // Remove trailing whitespace
        line.erase(line.find_last_not_of(" \n\r\t") + 1);

        // "<id> <label>" sets the index explicitly, a bare label uses the line number
        int id = lineNum;
        std::string label = line;
        size_t idEnd = line.find_first_not_of("0123456789");
        if (idEnd > 0 && idEnd < 10 && idEnd != std::string::npos &&
            (line[idEnd] == ' ' || line[idEnd] == '\t')) {
            std::string rest = line.substr(idEnd);
            rest.erase(0, rest.find_first_not_of(" \t"));
            if (!rest.empty()) {
                id = std::stoi(line.substr(0, idEnd));
                label = rest;
            }
        }

        if (!label.empty()) {
            labels[id] = label;
        }
        lineNum++;
    }

    std::cout << "Loaded " << labels.size() << " labels" << std::endl;
    return !labels.empty();
}

std::string SsdDetector::getLabel(int id) const {
    auto it = labels.find(id);
    if (it != labels.end()) {
        return it->second;
    }
    return "unknown";
}
