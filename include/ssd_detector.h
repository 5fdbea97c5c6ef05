#ifndef SSD_DETECTOR_H
#define SSD_DETECTOR_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "object_detector.h"

// Conditionally include TensorFlow Lite headers
#ifndef DISABLE_TENSORFLOW
#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/model.h>
#include <edgetpu.h>
#endif

/**
 * @brief COCO SSD MobileNet detector on TensorFlow Lite, with Edge TPU support
 */
class SsdDetector : public ObjectDetector {
public:
    /**
     * @brief Constructor. Nothing is loaded until initialize().
     * @param modelPath Path to the TFLite model
     * @param labelsPath Path to the labels file
     * @param minScore Detections scoring below this are not reported
     * @param maxDetections Maximum number of boxes reported per frame
     * @param forceCPU Force CPU mode (no TPU)
     */
    SsdDetector(const std::string& modelPath,
                const std::string& labelsPath,
                float minScore = 0.5f,
                int maxDetections = 20,
                bool forceCPU = false);

    ~SsdDetector() override;

    /**
     * @brief Load labels from a file
     * @param path Path to the labels file
     * @return True if successful, false otherwise
     */
    bool loadLabels(const std::string& path);

    /**
     * @brief Get the label for a class ID
     * @param id Class ID
     * @return Label string
     */
    std::string getLabel(int id) const;

    /**
     * @brief Check if inference runs on the Edge TPU
     * @return True if a TPU context is attached
     */
    bool isUsingTPU() const { return useTPU; }

    int getInputHeight() const { return inputHeight; }
    int getInputWidth() const { return inputWidth; }

protected:
    void loadModel() override;
    std::vector<RawDetection> runInference(const cv::Mat& frame) override;

private:
    std::string modelPath;
    std::string labelsPath;
    float minScore;
    int maxDetections;
    bool forceCPU;

    // Labels map
    std::map<int, std::string> labels;

    // Input tensor dimensions
    int inputHeight;
    int inputWidth;
    int inputChannels;

    bool useTPU;

#ifndef DISABLE_TENSORFLOW
    std::unique_ptr<tflite::FlatBufferModel> model;

    // Hold the Edge TPU context while the interpreter uses it
    std::shared_ptr<edgetpu::EdgeTpuContext> edgetpuContext;

    std::unique_ptr<tflite::Interpreter> interpreter;
#endif
};

#endif // SSD_DETECTOR_H
