#ifndef DETECTION_TYPES_H
#define DETECTION_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Axis-aligned bounding box in frame pixel coordinates
 */
class BBox {
public:
    BBox() : x(0.0f), y(0.0f), width(0.0f), height(0.0f) {}
    BBox(float x, float y, float width, float height)
        : x(x), y(y), width(width), height(height) {}

    float area() const { return width * height; }

    float x;
    float y;
    float width;
    float height;
};

/**
 * @brief One labeled, scored box as returned by the detector
 */
struct RawDetection {
    BBox bbox;
    std::string label;
    float score = 0.0f;
};

enum class ObjectKind {
    Person,
    Device
};

/**
 * @brief Detection mapped onto the monitoring vocabulary
 */
struct ClassifiedObject {
    ObjectKind kind = ObjectKind::Person;
    BBox bbox;
    float confidence = 0.0f;
};

/**
 * @brief What is visible in the current tick. Carries no history.
 */
struct DetectionSnapshot {
    int personCount = 0;
    bool deviceDetected = false;
    float confidence = 0.0f;
    std::vector<ClassifiedObject> objects;
};

enum class ViolationKind {
    MultiplePersons,
    DeviceDetected
};

struct ViolationAlert {
    ViolationKind kind = ViolationKind::MultiplePersons;
    std::string message;
    int64_t timestampMs = 0;
    float confidence = 0.0f;
};

inline const char* objectKindName(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Device: return "device";
        default: return "person";
    }
}

inline const char* violationKindName(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::DeviceDetected: return "device_detected";
        default: return "multiple_persons";
    }
}

#endif // DETECTION_TYPES_H
