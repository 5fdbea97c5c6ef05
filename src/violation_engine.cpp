#include "violation_engine.h"
#include <algorithm>
#include <string>

ViolationEngine::ViolationEngine(const ViolationEngineSettings& settings)
    : settings(settings),
      multiplePersonsWindow(static_cast<std::size_t>(std::max(settings.windowLength, 1))),
      deviceWindow(static_cast<std::size_t>(std::max(settings.windowLength, 1))) {
}

bool ViolationEngine::shouldFire(SmoothingWindow& window, bool conditionNow, int64_t nowMs) {
    const double ratio = window.push(conditionNow);
    if (ratio >= settings.triggerRatio && window.cooldownElapsed(nowMs, settings.cooldownMs)) {
        window.markAlerted(nowMs);
        return true;
    }
    return false;
}

std::vector<ViolationAlert> ViolationEngine::update(const std::vector<ClassifiedObject>& objects,
                                                    int64_t nowMs) {
    int personCount = 0;
    int deviceCount = 0;
    float maxPersonScore = 0.0f;
    float maxDeviceScore = 0.0f;

    for (const auto& object : objects) {
        if (object.kind == ObjectKind::Person) {
            personCount++;
            maxPersonScore = std::max(maxPersonScore, object.confidence);
        } else {
            deviceCount++;
            maxDeviceScore = std::max(maxDeviceScore, object.confidence);
        }
    }

    const bool multipleNow = personCount > settings.allowedPersons;
    const bool deviceNow = deviceCount > 0;

    std::vector<ViolationAlert> alerts;

    if (shouldFire(multiplePersonsWindow, multipleNow, nowMs)) {
        ViolationAlert alert;
        alert.kind = ViolationKind::MultiplePersons;
        alert.message = "Multiple people detected (" + std::to_string(personCount) + ").";
        alert.timestampMs = nowMs;
        alert.confidence = maxPersonScore > 0.0f ? maxPersonScore : kMultiplePersonsFallbackConfidence;
        alerts.push_back(alert);
    }

    if (shouldFire(deviceWindow, deviceNow, nowMs)) {
        ViolationAlert alert;
        alert.kind = ViolationKind::DeviceDetected;
        alert.message = "Mobile device detected in camera.";
        alert.timestampMs = nowMs;
        alert.confidence = maxDeviceScore > 0.0f ? maxDeviceScore : kDeviceFallbackConfidence;
        alerts.push_back(alert);
    }

    return alerts;
}

void ViolationEngine::reset() {
    multiplePersonsWindow.reset();
    deviceWindow.reset();
}

const SmoothingWindow& ViolationEngine::window(ViolationKind kind) const {
    return kind == ViolationKind::DeviceDetected ? deviceWindow : multiplePersonsWindow;
}
