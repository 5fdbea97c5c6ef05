#include "smoothing_window.h"
#include <algorithm>

SmoothingWindow::SmoothingWindow(std::size_t capacity)
    : capacity(std::max<std::size_t>(capacity, 1)), trues(0), lastAlertMs(0) {
}

double SmoothingWindow::push(bool conditionNow) {
    history.push_back(conditionNow);
    if (conditionNow) {
        trues++;
    }

    // Keep only the last `capacity` observations
    while (history.size() > capacity) {
        if (history.front()) {
            trues--;
        }
        history.pop_front();
    }

    return ratio();
}

double SmoothingWindow::ratio() const {
    if (history.empty()) {
        return 0.0;
    }
    return static_cast<double>(trues) / static_cast<double>(history.size());
}

void SmoothingWindow::reset() {
    history.clear();
    trues = 0;
    lastAlertMs = 0;
}
