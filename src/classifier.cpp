#include "classifier.h"
#include <algorithm>
#include "monitor_config.h"

namespace {
const char* const kPersonLabel = "person";
}

Classifier::Classifier(float minPersonScore, float minDeviceScore,
                       const std::set<std::string>& deviceClassNames)
    : minPersonScore(minPersonScore), minDeviceScore(minDeviceScore) {
    for (const auto& name : deviceClassNames) {
        this->deviceClassNames.insert(toLower(name));
    }
}

bool Classifier::isPersonClass(const std::string& label) const {
    return label == kPersonLabel;
}

bool Classifier::isDeviceClass(const std::string& label) const {
    return deviceClassNames.count(toLower(label)) > 0;
}

std::vector<ClassifiedObject> Classifier::classify(const std::vector<RawDetection>& detections) const {
    std::vector<ClassifiedObject> objects;
    for (const auto& detection : detections) {
        ClassifiedObject object;
        object.bbox = detection.bbox;
        object.confidence = detection.score;

        if (isPersonClass(detection.label) && detection.score >= minPersonScore) {
            object.kind = ObjectKind::Person;
            objects.push_back(object);
        } else if (isDeviceClass(detection.label) && detection.score >= minDeviceScore) {
            object.kind = ObjectKind::Device;
            objects.push_back(object);
        }
    }
    return objects;
}

DetectionSnapshot Classifier::snapshot(const std::vector<ClassifiedObject>& classified) {
    DetectionSnapshot result;
    float maxPerson = 0.0f;
    float maxDevice = 0.0f;
    bool anyPerson = false;

    for (const auto& object : classified) {
        if (object.kind == ObjectKind::Person) {
            result.personCount++;
            anyPerson = true;
            maxPerson = std::max(maxPerson, object.confidence);
        } else {
            result.deviceDetected = true;
            maxDevice = std::max(maxDevice, object.confidence);
        }
    }

    if (result.deviceDetected) {
        result.confidence = maxDevice;
    } else if (anyPerson) {
        result.confidence = maxPerson;
    }
    result.objects = classified;
    return result;
}
