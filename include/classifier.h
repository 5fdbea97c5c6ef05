#ifndef CLASSIFIER_H
#define CLASSIFIER_H

#include <set>
#include <string>
#include <vector>
#include "detection_types.h"

/**
 * @brief Maps detector labels onto {person, device} using per-class thresholds
 */
class Classifier {
public:
    /**
     * @brief Constructor
     * @param minPersonScore Minimum score for a "person" detection
     * @param minDeviceScore Minimum score for a device detection
     * @param deviceClassNames Labels counted as devices, compared case-insensitively
     */
    Classifier(float minPersonScore, float minDeviceScore,
               const std::set<std::string>& deviceClassNames);

    /**
     * @brief Classify detections. Output order follows input order; each
     *        detection yields at most one record.
     */
    std::vector<ClassifiedObject> classify(const std::vector<RawDetection>& detections) const;

    /**
     * @brief Summarize classified objects for display.
     *
     * Confidence is the best device score if a device is present, else the
     * best person score, else 0.
     */
    static DetectionSnapshot snapshot(const std::vector<ClassifiedObject>& classified);

    bool isPersonClass(const std::string& label) const;
    bool isDeviceClass(const std::string& label) const;

private:
    float minPersonScore;
    float minDeviceScore;
    std::set<std::string> deviceClassNames; // lower case
};

#endif // CLASSIFIER_H
