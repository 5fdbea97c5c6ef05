#ifndef BOX_FILTER_H
#define BOX_FILTER_H

#include <vector>
#include "detection_types.h"

/**
 * @brief Drops boxes that cover a negligible part of the frame
 */
class BoxFilter {
public:
    explicit BoxFilter(double minBoxAreaRatio);

    /**
     * @brief Keep detections whose box area / frame area >= minBoxAreaRatio
     * @param frameWidth Frame width in pixels
     * @param frameHeight Frame height in pixels
     * @param detections Detector output
     * @return Surviving detections, in input order. Empty for a zero-area frame.
     */
    std::vector<RawDetection> filter(int frameWidth, int frameHeight,
                                     const std::vector<RawDetection>& detections) const;

private:
    double minBoxAreaRatio;
};

#endif // BOX_FILTER_H
