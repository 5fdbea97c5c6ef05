#ifndef VIOLATION_ENGINE_H
#define VIOLATION_ENGINE_H

#include <cstdint>
#include <vector>
#include "detection_types.h"
#include "smoothing_window.h"

struct ViolationEngineSettings {
    int allowedPersons = 1;
    int windowLength = 12;
    double triggerRatio = 0.35;
    int64_t cooldownMs = 4000;
};

/**
 * @brief Turns per-tick classifier output into smoothed, rate-limited alerts
 *
 * One SmoothingWindow per violation kind. Kinds never share state: each has
 * its own history and cooldown, and both may fire in the same tick.
 */
class ViolationEngine {
public:
    // Reported when the objects behind an alert carry no score
    static constexpr float kMultiplePersonsFallbackConfidence = 0.9f;
    static constexpr float kDeviceFallbackConfidence = 0.8f;

    explicit ViolationEngine(const ViolationEngineSettings& settings);

    /**
     * @brief Feed one observed tick
     * @param objects Classified objects of this tick
     * @param nowMs Wall-clock time of the tick in epoch milliseconds
     * @return Alerts fired this tick, at most one per kind
     */
    std::vector<ViolationAlert> update(const std::vector<ClassifiedObject>& objects, int64_t nowMs);

    /**
     * @brief Clear both windows and both cooldown timestamps
     */
    void reset();

    const SmoothingWindow& window(ViolationKind kind) const;

private:
    bool shouldFire(SmoothingWindow& window, bool conditionNow, int64_t nowMs);

    ViolationEngineSettings settings;
    SmoothingWindow multiplePersonsWindow;
    SmoothingWindow deviceWindow;
};

#endif // VIOLATION_ENGINE_H
