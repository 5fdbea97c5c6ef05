#ifndef CAMERA_PROCESSOR_H
#define CAMERA_PROCESSOR_H

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Frame source for the monitor: reads a camera or video file on a
 *        background thread and keeps only the most recent frame.
 */
class CameraProcessor {
public:
    /**
     * @brief Constructor
     * @param cameraId Camera identifier used in log messages
     */
    explicit CameraProcessor(int cameraId = 0);

    /**
     * @brief Destructor
     */
    ~CameraProcessor();

    CameraProcessor(const CameraProcessor&) = delete;
    CameraProcessor& operator=(const CameraProcessor&) = delete;

    /**
     * @brief Open the camera source
     * @param source Camera source (index or path)
     * @return True if successful, false otherwise
     */
    bool openCamera(const std::string& source);

    /**
     * @brief Start the capture thread
     * @return True if successful, false otherwise
     */
    bool start();

    /**
     * @brief Stop capturing and release the source
     */
    void stop();

    /**
     * @brief Sample the latest frame
     * @return Copy of the latest frame; empty before the first frame arrives
     */
    cv::Mat getFrame() const;

    int getCameraId() const { return cameraId; }

    /**
     * @brief Get the frame width
     * @return Frame width, 0 until the source reports one
     */
    int getFrameWidth() const { return frameWidth; }

    /**
     * @brief Get the frame height
     * @return Frame height, 0 until the source reports one
     */
    int getFrameHeight() const { return frameHeight; }

    double getFPS() const { return fps; }

    int getTotalFrames() const { return totalFrames; }

    bool isRunning() const { return running; }

private:
    /**
     * @brief Thread function to capture frames from the camera
     */
    void captureFrames();

    int cameraId;
    cv::VideoCapture cap;
    std::atomic<int> frameWidth;
    std::atomic<int> frameHeight;
    double fps;
    bool isLiveCamera;

    std::atomic<bool> running;
    std::thread captureThread;

    cv::Mat lastFrame;
    mutable std::mutex lastFrameMutex;

    std::atomic<int> totalFrames;
};

#endif // CAMERA_PROCESSOR_H
