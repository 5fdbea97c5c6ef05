#ifndef SMOOTHING_WINDOW_H
#define SMOOTHING_WINDOW_H

#include <cstddef>
#include <cstdint>
#include <deque>

/**
 * @brief Fixed-capacity history of per-tick observations for one violation
 *        kind, plus the time of the last alert for that kind.
 *
 * The trigger ratio divides by the current length, so it is computed over
 * fewer samples until the window has filled.
 */
class SmoothingWindow {
public:
    explicit SmoothingWindow(std::size_t capacity);

    /**
     * @brief Record one observation, evicting the oldest when full
     * @param conditionNow Whether the violation condition held this tick
     * @return Ratio of true entries after the push
     */
    double push(bool conditionNow);

    /**
     * @brief Fraction of true entries in the current history (0 when empty)
     */
    double ratio() const;

    /**
     * @brief Check if the cooldown since the last alert has elapsed
     */
    bool cooldownElapsed(int64_t nowMs, int64_t cooldownMs) const {
        return nowMs - lastAlertMs >= cooldownMs;
    }

    void markAlerted(int64_t nowMs) { lastAlertMs = nowMs; }

    /**
     * @brief Clear the history and zero the cooldown timestamp
     */
    void reset();

    std::size_t size() const { return history.size(); }
    std::size_t getCapacity() const { return capacity; }
    std::size_t trueCount() const { return trues; }
    int64_t getLastAlertMs() const { return lastAlertMs; }

private:
    std::deque<bool> history;
    std::size_t capacity;
    std::size_t trues;
    int64_t lastAlertMs;
};

#endif // SMOOTHING_WINDOW_H
